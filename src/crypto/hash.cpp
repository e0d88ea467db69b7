#include "crypto/hash.hpp"

#include <oqs/sha3.h>

namespace dappvault::crypto {

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data) {
  Sha3_256Hash out{};
  OQS_SHA3_sha3_256(out.data(), data.data(), data.size());
  return out;
}

Sha3_256Hash Sha3_256Concat(std::initializer_list<std::span<const std::uint8_t>> parts) {
  OQS_SHA3_sha3_256_inc_ctx ctx;
  OQS_SHA3_sha3_256_inc_init(&ctx);
  for (const auto& part : parts) {
    OQS_SHA3_sha3_256_inc_absorb(&ctx, part.data(), part.size());
  }
  Sha3_256Hash out{};
  OQS_SHA3_sha3_256_inc_finalize(out.data(), &ctx);
  OQS_SHA3_sha3_256_inc_ctx_release(&ctx);
  return out;
}

}  // namespace dappvault::crypto
