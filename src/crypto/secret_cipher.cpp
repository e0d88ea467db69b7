#include "crypto/secret_cipher.hpp"

#include <stdexcept>
#include <string>

#include "crypto/hash.hpp"
#include "util/aead.hpp"
#include "util/csprng.hpp"
#include "util/errors.hpp"

namespace dappvault::crypto {

namespace {

constexpr std::string_view kSealAadTag = "dappvault/secret/v1";
constexpr std::string_view kPasswordCheckTag = "dappvault/password-check/v1";

std::span<const std::uint8_t> AsBytes(std::string_view text) {
  return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                       text.size());
}

// The salt is bound into the AAD so a payload cannot be re-paired with a
// different salt without failing authentication.
std::vector<std::uint8_t> BuildAad(std::span<const std::uint8_t> salt) {
  std::vector<std::uint8_t> aad(kSealAadTag.begin(), kSealAadTag.end());
  aad.insert(aad.end(), salt.begin(), salt.end());
  return aad;
}

bool DeriveKey(std::string_view password, std::span<const std::uint8_t> salt,
               const util::Argon2idParams& params, std::vector<std::uint8_t>* key,
               std::string* error) {
  key->assign(util::kChaCha20Poly1305KeySize, 0);
  return util::DeriveKeyArgon2id(AsBytes(password), salt, params, key, error);
}

}  // namespace

SecretCipher::SecretCipher(util::Argon2idParams params) : params_(params) {
  std::string error;
  if (!util::ValidateArgon2idParams(params_, &error)) {
    throw std::invalid_argument(error);
  }
}

SealedPayload SecretCipher::Seal(std::span<const std::uint8_t> plaintext,
                                 std::string_view password) const {
  SealedPayload sealed;
  sealed.salt = util::SecureRandomBytes(kSealSaltSize);
  sealed.iv = util::SecureRandomBytes(kSealIvSize);

  std::vector<std::uint8_t> key;
  std::string error;
  if (!DeriveKey(password, sealed.salt, params_, &key, &error)) {
    util::SecureWipe(key);
    throw std::runtime_error("key derivation failed: " + error);
  }
  util::Poly1305Tag tag{};
  util::ChaCha20Poly1305SealDetached(key, sealed.iv, BuildAad(sealed.salt), plaintext,
                                     &sealed.ciphertext, &tag);
  util::SecureWipe(key);
  sealed.auth_tag.assign(tag.begin(), tag.end());
  return sealed;
}

util::SecretBuffer SecretCipher::Open(const SealedPayload& sealed,
                                      std::string_view password) const {
  return Open(sealed, password, params_);
}

util::SecretBuffer SecretCipher::Open(const SealedPayload& sealed, std::string_view password,
                                      const util::Argon2idParams& params) {
  if (sealed.salt.size() != kSealSaltSize || sealed.iv.size() != kSealIvSize ||
      sealed.auth_tag.size() != kSealTagSize) {
    throw util::AuthenticationError("sealed payload is malformed");
  }
  std::vector<std::uint8_t> key;
  std::string error;
  if (!DeriveKey(password, sealed.salt, params, &key, &error)) {
    util::SecureWipe(key);
    throw util::AuthenticationError("key derivation failed: " + error);
  }
  std::vector<std::uint8_t> plaintext;
  const bool ok = util::ChaCha20Poly1305OpenDetached(key, sealed.iv, BuildAad(sealed.salt),
                                                     sealed.ciphertext, sealed.auth_tag,
                                                     &plaintext);
  util::SecureWipe(key);
  if (!ok) {
    throw util::AuthenticationError("authentication tag mismatch");
  }
  util::SecretBuffer out(std::span<const std::uint8_t>(plaintext.data(), plaintext.size()));
  util::SecureWipe(plaintext);
  return out;
}

std::vector<std::uint8_t> PasswordCheckHash(std::string_view password,
                                            std::span<const std::uint8_t> salt) {
  const auto digest = Sha3_256Concat({AsBytes(kPasswordCheckTag), salt, AsBytes(password)});
  return std::vector<std::uint8_t>(digest.begin(), digest.end());
}

bool VerifyPasswordCheckHash(std::string_view password, std::span<const std::uint8_t> salt,
                             std::span<const std::uint8_t> expected) {
  auto actual = PasswordCheckHash(password, salt);
  const bool match = util::ConstantTimeEqual(actual, expected);
  util::SecureWipe(actual);
  return match;
}

}  // namespace dappvault::crypto
