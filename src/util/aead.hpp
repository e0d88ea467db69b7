#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace dappvault::util {

constexpr std::size_t kChaCha20Poly1305KeySize = 32;
constexpr std::size_t kChaCha20Poly1305NonceSize = 12;
constexpr std::size_t kChaCha20Poly1305TagSize = 16;

using Poly1305Tag = std::array<std::uint8_t, kChaCha20Poly1305TagSize>;

// RFC 8439 ChaCha20-Poly1305 with the tag kept separate from the ciphertext.
// Throws std::invalid_argument on a bad key or nonce length.
void ChaCha20Poly1305SealDetached(std::span<const std::uint8_t> key,
                                  std::span<const std::uint8_t> nonce,
                                  std::span<const std::uint8_t> aad,
                                  std::span<const std::uint8_t> plaintext,
                                  std::vector<std::uint8_t>* ciphertext,
                                  Poly1305Tag* tag);

// Verifies the tag before decrypting anything. On failure `plaintext` is left
// untouched and false is returned.
bool ChaCha20Poly1305OpenDetached(std::span<const std::uint8_t> key,
                                  std::span<const std::uint8_t> nonce,
                                  std::span<const std::uint8_t> aad,
                                  std::span<const std::uint8_t> ciphertext,
                                  std::span<const std::uint8_t> tag,
                                  std::vector<std::uint8_t>* plaintext);

// Length-checked comparison whose running time depends only on the length.
bool ConstantTimeEqual(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept;

}  // namespace dappvault::util
