#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dappvault::util {

// Fills `out` with cryptographically secure random bytes.
bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error = nullptr);

// Returns `size` secure random bytes. Throws std::runtime_error when the
// operating system cannot provide randomness; salts, nonces and ids must never
// fall back to a predictable source.
std::vector<std::uint8_t> SecureRandomBytes(std::size_t size);

// Uniform random string over `alphabet`, used for record identifiers.
std::string SecureRandomString(std::size_t length, std::string_view alphabet);

}  // namespace dappvault::util
