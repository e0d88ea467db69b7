#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "util/argon2_kdf.hpp"
#include "util/secure_wipe.hpp"

namespace dappvault::crypto {

constexpr std::size_t kSealSaltSize = 16;
constexpr std::size_t kSealIvSize = 12;
constexpr std::size_t kSealTagSize = 16;

struct SealedPayload {
  std::vector<std::uint8_t> ciphertext;
  std::vector<std::uint8_t> iv;
  std::vector<std::uint8_t> auth_tag;
  std::vector<std::uint8_t> salt;
};

// Password-based authenticated encryption: Argon2id(password, salt) keys a
// ChaCha20-Poly1305 seal with a detached tag. Every Seal() draws a fresh salt
// and nonce, so sealing the same plaintext twice yields unrelated payloads.
class SecretCipher {
 public:
  explicit SecretCipher(util::Argon2idParams params = util::DefaultArgon2idParams());

  const util::Argon2idParams& params() const { return params_; }

  // Throws std::runtime_error if randomness or key derivation is unavailable.
  SealedPayload Seal(std::span<const std::uint8_t> plaintext, std::string_view password) const;

  // Opens with this cipher's parameters. Throws util::AuthenticationError when
  // the tag does not verify or a field has the wrong size; nothing is
  // decrypted in that case.
  util::SecretBuffer Open(const SealedPayload& sealed, std::string_view password) const;

  // Opens with explicit parameters, e.g. those recorded next to the payload.
  static util::SecretBuffer Open(const SealedPayload& sealed, std::string_view password,
                                 const util::Argon2idParams& params);

 private:
  util::Argon2idParams params_;
};

// Fast one-way pre-check hash stored beside a sealed record:
// SHA3-256("dappvault/password-check/v1" || salt || password).
std::vector<std::uint8_t> PasswordCheckHash(std::string_view password,
                                            std::span<const std::uint8_t> salt);

// Constant-time comparison against a stored check hash.
bool VerifyPasswordCheckHash(std::string_view password, std::span<const std::uint8_t> salt,
                             std::span<const std::uint8_t> expected);

}  // namespace dappvault::crypto
