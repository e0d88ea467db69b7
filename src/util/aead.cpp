#include "util/aead.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include "util/secure_wipe.hpp"

namespace dappvault::util {

namespace {

std::uint32_t LoadLe32(const std::uint8_t* in) {
  return static_cast<std::uint32_t>(in[0]) | (static_cast<std::uint32_t>(in[1]) << 8) |
         (static_cast<std::uint32_t>(in[2]) << 16) | (static_cast<std::uint32_t>(in[3]) << 24);
}

void StoreLe32(std::uint8_t* out, std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out[i] = static_cast<std::uint8_t>(value >> (8 * i));
  }
}

void StoreLe64(std::uint8_t* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<std::uint8_t>(value >> (8 * i));
  }
}

constexpr std::uint32_t Rotl(std::uint32_t v, int n) { return (v << n) | (v >> (32 - n)); }

// --- ChaCha20 (RFC 8439 section 2.3) ----------------------------------------

class ChaCha20 {
 public:
  ChaCha20(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce) {
    state_[0] = 0x61707865;
    state_[1] = 0x3320646e;
    state_[2] = 0x79622d32;
    state_[3] = 0x6b206574;
    for (int i = 0; i < 8; ++i) {
      state_[4 + i] = LoadLe32(key.data() + 4 * i);
    }
    state_[12] = 0;
    for (int i = 0; i < 3; ++i) {
      state_[13 + i] = LoadLe32(nonce.data() + 4 * i);
    }
  }

  ~ChaCha20() { SecureWipe(state_, sizeof(state_)); }

  void Keystream(std::uint32_t counter, std::uint8_t out[64]) {
    state_[12] = counter;
    std::uint32_t x[16];
    std::copy(std::begin(state_), std::end(state_), x);
    for (int round = 0; round < 10; ++round) {
      Quarter(x, 0, 4, 8, 12);
      Quarter(x, 1, 5, 9, 13);
      Quarter(x, 2, 6, 10, 14);
      Quarter(x, 3, 7, 11, 15);
      Quarter(x, 0, 5, 10, 15);
      Quarter(x, 1, 6, 11, 12);
      Quarter(x, 2, 7, 8, 13);
      Quarter(x, 3, 4, 9, 14);
    }
    for (int i = 0; i < 16; ++i) {
      StoreLe32(out + 4 * i, x[i] + state_[i]);
    }
    SecureWipe(x, sizeof(x));
  }

  // XOR `data` with the keystream starting at block `counter`.
  void Apply(std::uint32_t counter, std::span<std::uint8_t> data) {
    std::uint8_t block[64];
    for (std::size_t offset = 0; offset < data.size(); offset += 64) {
      Keystream(counter++, block);
      const std::size_t n = std::min<std::size_t>(64, data.size() - offset);
      for (std::size_t i = 0; i < n; ++i) {
        data[offset + i] ^= block[i];
      }
    }
    SecureWipe(block, sizeof(block));
  }

 private:
  static void Quarter(std::uint32_t* x, int a, int b, int c, int d) {
    x[a] += x[b]; x[d] = Rotl(x[d] ^ x[a], 16);
    x[c] += x[d]; x[b] = Rotl(x[b] ^ x[c], 12);
    x[a] += x[b]; x[d] = Rotl(x[d] ^ x[a], 8);
    x[c] += x[d]; x[b] = Rotl(x[b] ^ x[c], 7);
  }

  std::uint32_t state_[16]{};
};

// --- Poly1305 (RFC 8439 section 2.5), 26-bit limbs ---------------------------

class Poly1305 {
 public:
  explicit Poly1305(const std::uint8_t key[32]) {
    const std::uint32_t t0 = LoadLe32(key + 0);
    const std::uint32_t t1 = LoadLe32(key + 4);
    const std::uint32_t t2 = LoadLe32(key + 8);
    const std::uint32_t t3 = LoadLe32(key + 12);
    // r is clamped while being split into limbs.
    r_[0] = t0 & 0x3ffffff;
    r_[1] = ((t0 >> 26) | (t1 << 6)) & 0x3ffff03;
    r_[2] = ((t1 >> 20) | (t2 << 12)) & 0x3ffc0ff;
    r_[3] = ((t2 >> 14) | (t3 << 18)) & 0x3f03fff;
    r_[4] = (t3 >> 8) & 0x00fffff;
    for (int i = 0; i < 4; ++i) {
      pad_[i] = LoadLe32(key + 16 + 4 * i);
    }
  }

  ~Poly1305() {
    SecureWipe(r_, sizeof(r_));
    SecureWipe(pad_, sizeof(pad_));
    SecureWipe(h_, sizeof(h_));
  }

  // Absorb `data` followed by zero padding up to a 16-byte boundary. This is
  // the AEAD framing: every block, including the padded tail, is full-width.
  void AbsorbPadded(std::span<const std::uint8_t> data) {
    std::size_t offset = 0;
    while (data.size() - offset >= 16) {
      Block(data.data() + offset);
      offset += 16;
    }
    if (offset < data.size()) {
      std::uint8_t tail[16]{};
      std::memcpy(tail, data.data() + offset, data.size() - offset);
      Block(tail);
    }
  }

  Poly1305Tag Finish() {
    std::uint32_t h0 = h_[0], h1 = h_[1], h2 = h_[2], h3 = h_[3], h4 = h_[4];
    std::uint32_t c;
    c = h1 >> 26; h1 &= 0x3ffffff; h2 += c;
    c = h2 >> 26; h2 &= 0x3ffffff; h3 += c;
    c = h3 >> 26; h3 &= 0x3ffffff; h4 += c;
    c = h4 >> 26; h4 &= 0x3ffffff; h0 += c * 5;
    c = h0 >> 26; h0 &= 0x3ffffff; h1 += c;

    // g = h + 5 - 2^130; keep g when it did not underflow.
    std::uint32_t g0 = h0 + 5; c = g0 >> 26; g0 &= 0x3ffffff;
    std::uint32_t g1 = h1 + c; c = g1 >> 26; g1 &= 0x3ffffff;
    std::uint32_t g2 = h2 + c; c = g2 >> 26; g2 &= 0x3ffffff;
    std::uint32_t g3 = h3 + c; c = g3 >> 26; g3 &= 0x3ffffff;
    std::uint32_t g4 = h4 + c - (1u << 26);

    std::uint32_t mask = (g4 >> 31) - 1;
    g0 &= mask; g1 &= mask; g2 &= mask; g3 &= mask; g4 &= mask;
    mask = ~mask;
    h0 = (h0 & mask) | g0;
    h1 = (h1 & mask) | g1;
    h2 = (h2 & mask) | g2;
    h3 = (h3 & mask) | g3;
    h4 = (h4 & mask) | g4;

    // Repack into 4 x 32 bits and add the pad modulo 2^128.
    const std::uint32_t w0 = h0 | (h1 << 26);
    const std::uint32_t w1 = (h1 >> 6) | (h2 << 20);
    const std::uint32_t w2 = (h2 >> 12) | (h3 << 14);
    const std::uint32_t w3 = (h3 >> 18) | (h4 << 8);

    Poly1305Tag tag{};
    std::uint64_t f = static_cast<std::uint64_t>(w0) + pad_[0];
    StoreLe32(tag.data() + 0, static_cast<std::uint32_t>(f));
    f = static_cast<std::uint64_t>(w1) + pad_[1] + (f >> 32);
    StoreLe32(tag.data() + 4, static_cast<std::uint32_t>(f));
    f = static_cast<std::uint64_t>(w2) + pad_[2] + (f >> 32);
    StoreLe32(tag.data() + 8, static_cast<std::uint32_t>(f));
    f = static_cast<std::uint64_t>(w3) + pad_[3] + (f >> 32);
    StoreLe32(tag.data() + 12, static_cast<std::uint32_t>(f));
    return tag;
  }

 private:
  void Block(const std::uint8_t block[16]) {
    const std::uint64_t r0 = r_[0], r1 = r_[1], r2 = r_[2], r3 = r_[3], r4 = r_[4];
    const std::uint64_t s1 = r1 * 5, s2 = r2 * 5, s3 = r3 * 5, s4 = r4 * 5;

    const std::uint32_t t0 = LoadLe32(block + 0);
    const std::uint32_t t1 = LoadLe32(block + 4);
    const std::uint32_t t2 = LoadLe32(block + 8);
    const std::uint32_t t3 = LoadLe32(block + 12);

    const std::uint64_t h0 = h_[0] + (t0 & 0x3ffffff);
    const std::uint64_t h1 = h_[1] + (((t0 >> 26) | (t1 << 6)) & 0x3ffffff);
    const std::uint64_t h2 = h_[2] + (((t1 >> 20) | (t2 << 12)) & 0x3ffffff);
    const std::uint64_t h3 = h_[3] + (((t2 >> 14) | (t3 << 18)) & 0x3ffffff);
    const std::uint64_t h4 = h_[4] + ((t3 >> 8) | (1u << 24));

    std::uint64_t d0 = h0 * r0 + h1 * s4 + h2 * s3 + h3 * s2 + h4 * s1;
    std::uint64_t d1 = h0 * r1 + h1 * r0 + h2 * s4 + h3 * s3 + h4 * s2;
    std::uint64_t d2 = h0 * r2 + h1 * r1 + h2 * r0 + h3 * s4 + h4 * s3;
    std::uint64_t d3 = h0 * r3 + h1 * r2 + h2 * r1 + h3 * r0 + h4 * s4;
    std::uint64_t d4 = h0 * r4 + h1 * r3 + h2 * r2 + h3 * r1 + h4 * r0;

    d1 += d0 >> 26;
    d2 += d1 >> 26;
    d3 += d2 >> 26;
    d4 += d3 >> 26;
    std::uint64_t n0 = (d0 & 0x3ffffff) + (d4 >> 26) * 5;
    std::uint64_t n1 = (d1 & 0x3ffffff) + (n0 >> 26);
    h_[0] = static_cast<std::uint32_t>(n0 & 0x3ffffff);
    h_[1] = static_cast<std::uint32_t>(n1);
    h_[2] = static_cast<std::uint32_t>(d2 & 0x3ffffff);
    h_[3] = static_cast<std::uint32_t>(d3 & 0x3ffffff);
    h_[4] = static_cast<std::uint32_t>(d4 & 0x3ffffff);
  }

  std::uint32_t r_[5]{};
  std::uint32_t pad_[4]{};
  std::uint32_t h_[5]{};
};

Poly1305Tag ComputeTag(ChaCha20& cipher, std::span<const std::uint8_t> aad,
                       std::span<const std::uint8_t> ciphertext) {
  // The one-time Poly1305 key is the first half of keystream block 0.
  std::uint8_t block0[64];
  cipher.Keystream(0, block0);
  Poly1305 mac(block0);
  SecureWipe(block0, sizeof(block0));

  mac.AbsorbPadded(aad);
  mac.AbsorbPadded(ciphertext);
  std::uint8_t lengths[16];
  StoreLe64(lengths + 0, static_cast<std::uint64_t>(aad.size()));
  StoreLe64(lengths + 8, static_cast<std::uint64_t>(ciphertext.size()));
  mac.AbsorbPadded(lengths);
  return mac.Finish();
}

bool ValidSizes(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce) {
  return key.size() == kChaCha20Poly1305KeySize && nonce.size() == kChaCha20Poly1305NonceSize;
}

}  // namespace

bool ConstantTimeEqual(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  volatile std::uint8_t diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff = static_cast<std::uint8_t>(diff | (a[i] ^ b[i]));
  }
  return diff == 0;
}

void ChaCha20Poly1305SealDetached(std::span<const std::uint8_t> key,
                                  std::span<const std::uint8_t> nonce,
                                  std::span<const std::uint8_t> aad,
                                  std::span<const std::uint8_t> plaintext,
                                  std::vector<std::uint8_t>* ciphertext,
                                  Poly1305Tag* tag) {
  if (!ValidSizes(key, nonce)) {
    throw std::invalid_argument("invalid key/nonce length");
  }
  if (ciphertext == nullptr || tag == nullptr) {
    throw std::invalid_argument("null output");
  }
  ChaCha20 cipher(key, nonce);
  ciphertext->assign(plaintext.begin(), plaintext.end());
  cipher.Apply(1, std::span<std::uint8_t>(ciphertext->data(), ciphertext->size()));
  *tag = ComputeTag(cipher, aad, *ciphertext);
}

bool ChaCha20Poly1305OpenDetached(std::span<const std::uint8_t> key,
                                  std::span<const std::uint8_t> nonce,
                                  std::span<const std::uint8_t> aad,
                                  std::span<const std::uint8_t> ciphertext,
                                  std::span<const std::uint8_t> tag,
                                  std::vector<std::uint8_t>* plaintext) {
  if (!ValidSizes(key, nonce) || tag.size() != kChaCha20Poly1305TagSize ||
      plaintext == nullptr) {
    return false;
  }
  ChaCha20 cipher(key, nonce);
  const auto expected = ComputeTag(cipher, aad, ciphertext);
  if (!ConstantTimeEqual(expected, tag)) {
    return false;
  }
  std::vector<std::uint8_t> out(ciphertext.begin(), ciphertext.end());
  cipher.Apply(1, std::span<std::uint8_t>(out.data(), out.size()));
  SecureWipe(*plaintext);
  *plaintext = std::move(out);
  return true;
}

}  // namespace dappvault::util
