#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "util/aead.hpp"
#include "util/hex.hpp"

using dappvault::util::ChaCha20Poly1305OpenDetached;
using dappvault::util::ChaCha20Poly1305SealDetached;
using dappvault::util::HexDecode;
using dappvault::util::HexEncode;
using dappvault::util::Poly1305Tag;

namespace {

// RFC 8439 section 2.8.2.
const char* kSunscreen =
    "Ladies and Gentlemen of the class of '99: If I could offer you only one tip for the "
    "future, sunscreen would be it.";
const char* kExpectedCiphertext =
    "d31a8d34648e60db7b86afbc53ef7ec2a4aded51296e08fea9e2b5a736ee62d63dbea45e8ca9671282fafb69da"
    "92728b1a71de0a9e060b2905d6a5b67ecd3b3692ddbd7f2d778b8c9803aee328091b58fab324e4fad675945585"
    "808b4831d7bc3ff4def08e4b7a9de576d26586cec64b6116";
const char* kExpectedTag = "1ae10b594f09e26a7e902ecbd0600691";

std::vector<std::uint8_t> Key() {
  std::vector<std::uint8_t> key(32);
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<std::uint8_t>(0x80 + i);
  }
  return key;
}

std::vector<std::uint8_t> Bytes(const char* hex) {
  std::vector<std::uint8_t> out;
  HexDecode(hex, &out);
  return out;
}

bool TestRfc8439Vector() {
  const auto key = Key();
  const auto nonce = Bytes("070000004041424344454647");
  const auto aad = Bytes("50515253c0c1c2c3c4c5c6c7");
  const std::string text = kSunscreen;
  const std::vector<std::uint8_t> plaintext(text.begin(), text.end());

  std::vector<std::uint8_t> ciphertext;
  Poly1305Tag tag{};
  ChaCha20Poly1305SealDetached(key, nonce, aad, plaintext, &ciphertext, &tag);
  if (HexEncode(ciphertext) != kExpectedCiphertext) {
    std::cerr << "aead_tests: ciphertext mismatch\n  got " << HexEncode(ciphertext) << "\n";
    return false;
  }
  if (HexEncode(tag) != kExpectedTag) {
    std::cerr << "aead_tests: tag mismatch, got " << HexEncode(tag) << "\n";
    return false;
  }

  std::vector<std::uint8_t> opened;
  if (!ChaCha20Poly1305OpenDetached(key, nonce, aad, ciphertext, tag, &opened) ||
      opened != plaintext) {
    std::cerr << "aead_tests: open of the RFC vector failed\n";
    return false;
  }
  return true;
}

bool TestTamperingIsRejected() {
  const auto key = Key();
  const auto nonce = Bytes("000000000000000000000001");
  const std::vector<std::uint8_t> aad{'v', '1'};
  const std::vector<std::uint8_t> plaintext{'s', 'e', 'c', 'r', 'e', 't'};
  std::vector<std::uint8_t> ciphertext;
  Poly1305Tag tag{};
  ChaCha20Poly1305SealDetached(key, nonce, aad, plaintext, &ciphertext, &tag);

  std::vector<std::uint8_t> sentinel{0xAA};
  auto flipped = ciphertext;
  flipped[0] ^= 0x01;
  if (ChaCha20Poly1305OpenDetached(key, nonce, aad, flipped, tag, &sentinel)) {
    std::cerr << "aead_tests: modified ciphertext was accepted\n";
    return false;
  }
  const std::vector<std::uint8_t> other_aad{'v', '2'};
  if (ChaCha20Poly1305OpenDetached(key, nonce, other_aad, ciphertext, tag, &sentinel)) {
    std::cerr << "aead_tests: mismatched associated data was accepted\n";
    return false;
  }
  auto bad_tag = tag;
  bad_tag[15] ^= 0x80;
  if (ChaCha20Poly1305OpenDetached(key, nonce, aad, ciphertext, bad_tag, &sentinel)) {
    std::cerr << "aead_tests: modified tag was accepted\n";
    return false;
  }
  if (sentinel.size() != 1 || sentinel[0] != 0xAA) {
    std::cerr << "aead_tests: failed open touched the output buffer\n";
    return false;
  }
  return true;
}

bool TestEmptyPlaintext() {
  const auto key = Key();
  const auto nonce = Bytes("000000000000000000000002");
  std::vector<std::uint8_t> ciphertext{1, 2, 3};
  Poly1305Tag tag{};
  ChaCha20Poly1305SealDetached(key, nonce, {}, {}, &ciphertext, &tag);
  std::vector<std::uint8_t> opened{9};
  if (!ciphertext.empty() ||
      !ChaCha20Poly1305OpenDetached(key, nonce, {}, ciphertext, tag, &opened) ||
      !opened.empty()) {
    std::cerr << "aead_tests: empty plaintext did not round-trip\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestRfc8439Vector()) {
      return EXIT_FAILURE;
    }
    if (!TestTamperingIsRejected()) {
      return EXIT_FAILURE;
    }
    if (!TestEmptyPlaintext()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "aead_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
