#include "gateway/key_format.hpp"

namespace dappvault::gateway {

namespace {

bool IsAlnum(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool HasShape(std::string_view value, std::string_view prefix, std::size_t length) {
  if (value.size() != length || value.substr(0, prefix.size()) != prefix) {
    return false;
  }
  for (char c : value) {
    if (!IsAlnum(c)) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool IsValidPrivateKey(std::string_view key) {
  return HasShape(key, kPrivateKeyPrefix, kPrivateKeyLength);
}

bool IsValidViewKey(std::string_view key) { return HasShape(key, kViewKeyPrefix, kViewKeyLength); }

bool IsValidAddress(std::string_view address) {
  return HasShape(address, kAddressPrefix, kAddressLength);
}

bool IsValidSeedPhrase(std::string_view phrase) {
  std::size_t words = 0;
  std::size_t word_length = 0;
  for (char c : phrase) {
    if (c == ' ') {
      if (word_length == 0) {
        return false;
      }
      ++words;
      word_length = 0;
      continue;
    }
    if (c < 'a' || c > 'z') {
      return false;
    }
    ++word_length;
  }
  if (word_length == 0) {
    return false;
  }
  ++words;
  return words == 12 || words == 15 || words == 18 || words == 21 || words == 24;
}

}  // namespace dappvault::gateway
