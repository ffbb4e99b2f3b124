#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace projmgr::util {

/*
  Central error types.

  Thrown by the store, selector and git layers. The batch runner catches them
  per target; main() turns an escaping one into exit code 1.
*/

// Bad identifier, type or argument. Raised before any side effect.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A name or pattern resolved to several projects where only one is allowed.
class AmbiguousSelection : public std::runtime_error {
 public:
  explicit AmbiguousSelection(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A credential would have been sent to a host outside the allow-list.
class UntrustedHost : public std::runtime_error {
 public:
  explicit UntrustedHost(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  An external tool (docker, systemctl, git, a project script) failed.
  Carries whatever the tool printed so the caller can surface it.
*/
class ExternalToolError : public std::runtime_error {
 public:
  ExternalToolError(const std::string& msg, std::string output) : std::runtime_error(msg), output_(std::move(output)) {
  }

  const std::string& output() const {
    return output_;
  }

 private:
  std::string output_;
};

} // namespace projmgr::util
