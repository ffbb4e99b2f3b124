#pragma once

#include <cstdint>
#include <string_view>

namespace projmgr::model {

// Observed, never persisted.
enum class RunningState : std::uint8_t {
  kRunning = 0,
  kStopped = 1,
  kUnknown = 2,
};

/*
  Derived lifecycle state. Only `enabled` is stored; the rest comes from
  probing the backend at the time of the call.
*/
enum class LifecycleState : std::uint8_t {
  kDisabled       = 0,
  kEnabledStopped = 1,
  kEnabledRunning = 2,
  kEnabledUnknown = 3,
};

constexpr LifecycleState Derive(bool enabled, RunningState running) {
  if (!enabled) {
    return LifecycleState::kDisabled;
  }
  switch (running) {
    case RunningState::kRunning:
      return LifecycleState::kEnabledRunning;
    case RunningState::kStopped:
      return LifecycleState::kEnabledStopped;
    case RunningState::kUnknown:
      return LifecycleState::kEnabledUnknown;
  }
  return LifecycleState::kEnabledUnknown;
}

// The state that definitely contradicts `expected`; Unknown has none.
constexpr RunningState Opposite(RunningState expected) {
  switch (expected) {
    case RunningState::kRunning:
      return RunningState::kStopped;
    case RunningState::kStopped:
      return RunningState::kRunning;
    case RunningState::kUnknown:
      return RunningState::kUnknown;
  }
  return RunningState::kUnknown;
}

constexpr std::string_view ToString(RunningState state) {
  switch (state) {
    case RunningState::kRunning:
      return "Yes";
    case RunningState::kStopped:
      return "No";
    case RunningState::kUnknown:
      return "Unknown";
  }
  return "Unknown";
}

} // namespace projmgr::model
