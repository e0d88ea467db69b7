#include "util/time.hpp"

#include <chrono>

namespace dappvault::util {

std::int64_t UnixTimeMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace dappvault::util
