#include "time.hpp"

#include <thread>

namespace projmgr::util {

void SleepFor(std::chrono::milliseconds duration) {
  if (duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
}

} // namespace projmgr::util
