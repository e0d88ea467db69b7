#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace dappvault::util {

struct Argon2idParams {
  std::uint32_t t_cost;        // iterations
  std::uint32_t m_cost_kib;    // memory in KiB
  std::uint32_t parallelism;   // lanes
};

// 3 iterations, 64 MiB, single lane.
Argon2idParams DefaultArgon2idParams();

// Upper bounds accepted for parameters read back from disk. A wallet file is
// untrusted input and must not be able to request unbounded work.
constexpr std::uint32_t kArgon2MaxTimeCost = 10;
constexpr std::uint32_t kArgon2MaxMemoryKib = 1024 * 1024;  // 1 GiB
constexpr std::uint32_t kArgon2MaxParallelism = 8;

// Returns false and fills `error` when a parameter is zero, below the libargon2
// minimum memory (8 KiB per lane), or above the caps.
bool ValidateArgon2idParams(const Argon2idParams& params, std::string* error = nullptr);

// Derive a key of `key_out->size()` bytes (32 when empty) using Argon2id.
bool DeriveKeyArgon2id(std::span<const std::uint8_t> password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::vector<std::uint8_t>* key_out,
                       std::string* error = nullptr);

}  // namespace dappvault::util
