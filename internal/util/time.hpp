#pragma once

#include <chrono>

namespace projmgr::util {

/*
  Wall-clock waits. Anything that polls takes a Sleeper instead and gets this
  one wired in by the factory.
*/

// No-op for zero or negative durations.
void SleepFor(std::chrono::milliseconds duration);

} // namespace projmgr::util
