#pragma once

#include <cstddef>
#include <string_view>

namespace dappvault::gateway {

constexpr std::string_view kPrivateKeyPrefix = "APrivateKey1";
constexpr std::string_view kViewKeyPrefix = "AViewKey1";
constexpr std::string_view kAddressPrefix = "aleo1";

constexpr std::size_t kPrivateKeyLength = 59;
constexpr std::size_t kViewKeyLength = 53;
constexpr std::size_t kAddressLength = 63;

bool IsValidPrivateKey(std::string_view key);
bool IsValidViewKey(std::string_view key);
bool IsValidAddress(std::string_view address);

// 12, 15, 18, 21 or 24 lowercase ASCII words separated by single spaces.
bool IsValidSeedPhrase(std::string_view phrase);

}  // namespace dappvault::gateway
