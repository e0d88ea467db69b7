#include "util/base64.hpp"

#include <cstdint>

namespace dappvault::util {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

}  // namespace

std::string Base64Encode(std::string_view input) {
  std::string encoded;
  encoded.reserve(((input.size() + 2) / 3) * 4);
  std::size_t i = 0;
  for (; i + 3 <= input.size(); i += 3) {
    const std::uint32_t group = (static_cast<std::uint8_t>(input[i]) << 16) |
                                (static_cast<std::uint8_t>(input[i + 1]) << 8) |
                                static_cast<std::uint8_t>(input[i + 2]);
    encoded.push_back(kAlphabet[(group >> 18) & 0x3f]);
    encoded.push_back(kAlphabet[(group >> 12) & 0x3f]);
    encoded.push_back(kAlphabet[(group >> 6) & 0x3f]);
    encoded.push_back(kAlphabet[group & 0x3f]);
  }
  const std::size_t rest = input.size() - i;
  if (rest > 0) {
    std::uint32_t group = static_cast<std::uint8_t>(input[i]) << 16;
    if (rest == 2) {
      group |= static_cast<std::uint8_t>(input[i + 1]) << 8;
    }
    encoded.push_back(kAlphabet[(group >> 18) & 0x3f]);
    encoded.push_back(kAlphabet[(group >> 12) & 0x3f]);
    encoded.push_back(rest == 2 ? kAlphabet[(group >> 6) & 0x3f] : '=');
    encoded.push_back('=');
  }
  return encoded;
}

}  // namespace dappvault::util
