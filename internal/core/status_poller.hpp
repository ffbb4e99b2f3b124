#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

#include "internal/model/state_machine.hpp"

namespace projmgr::core {

struct RetryPolicy {
  // Probes after the immediate first one. 0 means a single check.
  std::uint32_t             max_attempts = 10;
  std::chrono::milliseconds interval{100};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/*
  Calls `probe` once right away and then up to policy.max_attempts more times,
  sleeping `interval` before each retry. Stops at the first value accepted by
  `done` and returns the last probed value either way.
*/
template <typename Probe, typename Predicate>
auto RetryUntil(Probe&& probe, Predicate&& done, const RetryPolicy& policy, const Sleeper& sleep) -> decltype(probe()) {
  auto value = probe();
  for (std::uint32_t attempt = 1; attempt <= policy.max_attempts && !done(value); ++attempt) {
    sleep(policy.interval);
    value = probe();
  }
  return value;
}

enum class Confirmation {
  kConfirmed,
  kTimedOut,  // ended in the definite opposite state
  kUnknown,   // ended without a definite state
};

struct ConfirmResult {
  Confirmation        confirmation = Confirmation::kUnknown;
  model::RunningState last         = model::RunningState::kUnknown;
  std::uint32_t       probes       = 0;

  // Milliseconds spent waiting, for messages.
  std::uint64_t waited_ms = 0;
};

/*
  Turns an asynchronous start/stop into a confirmed outcome. Only bounds the
  confirmation; the triggering command has already returned.
*/
class StatusPoller {
 public:
  StatusPoller(RetryPolicy policy, Sleeper sleep);

  const RetryPolicy& policy() const {
    return policy_;
  }

  // Same sleeper, different attempt cap (used for --no-status-check).
  StatusPoller WithMaxAttempts(std::uint32_t max_attempts) const;

  ConfirmResult Confirm(model::RunningState expected, const std::function<model::RunningState()>& probe) const;

 private:
  RetryPolicy policy_;
  Sleeper     sleep_;
};

} // namespace projmgr::core
