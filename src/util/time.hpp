#pragma once

#include <cstdint>
#include <functional>

namespace dappvault::util {

// Milliseconds since the Unix epoch from the system clock.
std::int64_t UnixTimeMillis();

// Injectable wall clock; services default to UnixTimeMillis.
using NowFn = std::function<std::int64_t()>;

}  // namespace dappvault::util
