#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "crypto/secret_cipher.hpp"
#include "util/errors.hpp"
#include "util/hex.hpp"

using dappvault::crypto::SecretCipher;

namespace {

// Minimum libargon2 memory keeps the test fast.
dappvault::util::Argon2idParams FastParams() { return {1, 8, 1}; }

std::vector<std::uint8_t> Bytes(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

bool TestSha3KnownAnswer() {
  // FIPS 202 SHA3-256("abc").
  const auto digest = dappvault::crypto::Sha3_256(Bytes("abc"));
  if (dappvault::util::HexEncode(digest) !=
      "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532") {
    std::cerr << "secret_cipher_tests: SHA3-256(abc) mismatch\n";
    return false;
  }
  const auto a = Bytes("ab");
  const auto c = Bytes("c");
  if (dappvault::crypto::Sha3_256Concat({a, c}) != digest) {
    std::cerr << "secret_cipher_tests: concatenated hash differs from one-shot\n";
    return false;
  }
  return true;
}

bool TestSealOpen() {
  SecretCipher cipher(FastParams());
  const auto plaintext = Bytes("APrivateKey1zkp-test-material");
  const auto first = cipher.Seal(plaintext, "correct horse");
  const auto second = cipher.Seal(plaintext, "correct horse");
  if (first.salt.size() != dappvault::crypto::kSealSaltSize ||
      first.iv.size() != dappvault::crypto::kSealIvSize ||
      first.auth_tag.size() != dappvault::crypto::kSealTagSize) {
    std::cerr << "secret_cipher_tests: sealed payload has wrong field sizes\n";
    return false;
  }
  if (first.salt == second.salt || first.iv == second.iv || first.ciphertext == second.ciphertext) {
    std::cerr << "secret_cipher_tests: repeated seals must use fresh salt and nonce\n";
    return false;
  }
  const auto opened = cipher.Open(first, "correct horse");
  if (opened.view() != "APrivateKey1zkp-test-material") {
    std::cerr << "secret_cipher_tests: open returned wrong plaintext\n";
    return false;
  }
  return true;
}

bool TestWrongPasswordAndTamper() {
  SecretCipher cipher(FastParams());
  auto sealed = cipher.Seal(Bytes("payload"), "password-one");
  try {
    (void)cipher.Open(sealed, "password-two");
    std::cerr << "secret_cipher_tests: wrong password opened the payload\n";
    return false;
  } catch (const dappvault::util::AuthenticationError&) {
  }
  sealed.ciphertext[0] ^= 0x01;
  try {
    (void)cipher.Open(sealed, "password-one");
    std::cerr << "secret_cipher_tests: tampered ciphertext opened\n";
    return false;
  } catch (const dappvault::util::AuthenticationError&) {
  }
  sealed.ciphertext[0] ^= 0x01;
  sealed.iv.pop_back();
  try {
    (void)cipher.Open(sealed, "password-one");
    std::cerr << "secret_cipher_tests: short nonce was accepted\n";
    return false;
  } catch (const dappvault::util::AuthenticationError&) {
  }
  return true;
}

bool TestPasswordCheckHash() {
  const std::vector<std::uint8_t> salt(16, 0x42);
  const auto check = dappvault::crypto::PasswordCheckHash("hunter22", salt);
  if (check.size() != 32) {
    std::cerr << "secret_cipher_tests: check hash should be 32 bytes\n";
    return false;
  }
  if (!dappvault::crypto::VerifyPasswordCheckHash("hunter22", salt, check) ||
      dappvault::crypto::VerifyPasswordCheckHash("hunter23", salt, check)) {
    std::cerr << "secret_cipher_tests: check hash verification is wrong\n";
    return false;
  }
  const std::vector<std::uint8_t> other_salt(16, 0x43);
  if (dappvault::crypto::PasswordCheckHash("hunter22", other_salt) == check) {
    std::cerr << "secret_cipher_tests: check hash ignores the salt\n";
    return false;
  }
  return true;
}

bool TestParamValidation() {
  std::string error;
  if (dappvault::util::ValidateArgon2idParams({1, 4, 1}, &error) ||
      dappvault::util::ValidateArgon2idParams({0, 8, 1}, &error) ||
      dappvault::util::ValidateArgon2idParams({1, 8, 0}, &error) ||
      dappvault::util::ValidateArgon2idParams(
          {dappvault::util::kArgon2MaxTimeCost + 1, 65536, 1}, &error)) {
    std::cerr << "secret_cipher_tests: out-of-range Argon2 params were accepted\n";
    return false;
  }
  if (!dappvault::util::ValidateArgon2idParams(dappvault::util::DefaultArgon2idParams(), &error)) {
    std::cerr << "secret_cipher_tests: default params rejected: " << error << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestSha3KnownAnswer() || !TestSealOpen() || !TestWrongPasswordAndTamper() ||
        !TestPasswordCheckHash() || !TestParamValidation()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "secret_cipher_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
