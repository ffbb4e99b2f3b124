#pragma once

#include <istream>
#include <memory>
#include <ostream>
#include <string>

namespace projmgr::ui {

/*
  Interactive questions to the operator.

  Callers decide whether to ask at all (quiet/force); the prompter only asks.
*/
class Prompter {
 public:
  virtual ~Prompter() = default;

  // Yes/no question, repeated until answered.
  virtual bool Confirm(const std::string& question) = 0;

  // Free text answer, empty when the operator just presses enter.
  virtual std::string Ask(const std::string& question) = 0;
};

using PrompterPtr = std::shared_ptr<Prompter>;

class ConsolePrompter final : public Prompter {
 public:
  ConsolePrompter(std::istream& in, std::ostream& out);

  bool        Confirm(const std::string& question) override;
  std::string Ask(const std::string& question) override;

 private:
  std::istream& in_;
  std::ostream& out_;
};

} // namespace projmgr::ui
