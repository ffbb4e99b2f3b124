#include "status_poller.hpp"

namespace projmgr::core {

StatusPoller::StatusPoller(RetryPolicy policy, Sleeper sleep) : policy_(policy), sleep_(std::move(sleep)) {
}

StatusPoller StatusPoller::WithMaxAttempts(std::uint32_t max_attempts) const {
  RetryPolicy policy  = policy_;
  policy.max_attempts = max_attempts;
  return StatusPoller(policy, sleep_);
}

ConfirmResult StatusPoller::Confirm(model::RunningState expected, const std::function<model::RunningState()>& probe) const {
  ConfirmResult result;
  const auto    counted = [&] {
    ++result.probes;
    return probe();
  };

  result.last      = RetryUntil(counted, [expected](model::RunningState state) { return state == expected; }, policy_, sleep_);
  result.waited_ms = static_cast<std::uint64_t>(result.probes - 1) * static_cast<std::uint64_t>(policy_.interval.count());

  if (result.last == expected) {
    result.confirmation = Confirmation::kConfirmed;
  } else if (result.last == model::Opposite(expected)) {
    result.confirmation = Confirmation::kTimedOut;
  } else {
    result.confirmation = Confirmation::kUnknown;
  }
  return result;
}

} // namespace projmgr::core
