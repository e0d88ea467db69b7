#include "util/secure_wipe.hpp"

#include <cstring>
#include <utility>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#endif

namespace dappvault::util {

void SecureWipe(void* data, std::size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }
#ifdef _WIN32
  SecureZeroMemory(data, size);
#elif defined(__STDC_LIB_EXT1__)
  (void)memset_s(data, size, 0, size);
#else
  volatile std::uint8_t* ptr = reinterpret_cast<volatile std::uint8_t*>(data);
  while (size--) {
    *ptr++ = 0;
  }
#endif
}

SecretBuffer::SecretBuffer(std::string_view text)
    : bytes_(text.begin(), text.end()), size_(text.size()) {}

SecretBuffer::SecretBuffer(std::span<const std::uint8_t> bytes)
    : bytes_(bytes.begin(), bytes.end()), size_(bytes.size()) {}

SecretBuffer::SecretBuffer(SecretBuffer&& other) noexcept
    : bytes_(std::move(other.bytes_)), size_(other.size_) {
  other.bytes_.clear();
  other.size_ = 0;
}

SecretBuffer& SecretBuffer::operator=(SecretBuffer&& other) noexcept {
  if (this != &other) {
    SecureWipe(bytes_.data(), bytes_.size());
    bytes_ = std::move(other.bytes_);
    size_ = other.size_;
    other.bytes_.clear();
    other.size_ = 0;
  }
  return *this;
}

SecretBuffer::~SecretBuffer() { SecureWipe(bytes_.data(), bytes_.size()); }

void SecretBuffer::Wipe() noexcept {
  SecureWipe(bytes_.data(), bytes_.size());
  size_ = 0;
}

}  // namespace dappvault::util
