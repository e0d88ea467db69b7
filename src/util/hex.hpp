#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dappvault::util {

// Lowercase hex, the encoding used for every binary field on disk.
std::string HexEncode(std::span<const std::uint8_t> data);

// Accepts either case. On failure `out` is cleared.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

}  // namespace dappvault::util
