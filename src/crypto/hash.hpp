#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>

namespace dappvault::crypto {

using Sha3_256Hash = std::array<std::uint8_t, 32>;

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data);

// SHA3-256 over the concatenation of `parts`, without materialising the joined
// buffer (secret inputs stay in their own wiping storage).
Sha3_256Hash Sha3_256Concat(std::initializer_list<std::span<const std::uint8_t>> parts);

}  // namespace dappvault::crypto
