#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dappvault::util {

// Securely overwrite memory so the compiler cannot optimize the wipe away.
void SecureWipe(void* data, std::size_t size) noexcept;

inline void SecureWipe(std::span<std::uint8_t> data) noexcept {
  SecureWipe(data.data(), data.size());
}

inline void SecureWipe(std::vector<std::uint8_t>& data) noexcept {
  SecureWipe(data.data(), data.size());
  std::vector<std::uint8_t>().swap(data);
}

inline void SecureWipe(std::string& data) noexcept {
  SecureWipe(data.data(), data.size());
  std::string().swap(data);
}

template <typename T, std::size_t N>
inline void SecureWipe(std::array<T, N>& data) noexcept {
  SecureWipe(data.data(), data.size() * sizeof(T));
}

// Move-only owner of secret bytes. The backing storage is zeroed by Wipe(),
// by assignment over a previous value, and on destruction. Storage is never
// reallocated after construction, so no stale copy is left behind on the heap.
class SecretBuffer {
 public:
  SecretBuffer() = default;
  explicit SecretBuffer(std::string_view text);
  explicit SecretBuffer(std::span<const std::uint8_t> bytes);
  SecretBuffer(const SecretBuffer&) = delete;
  SecretBuffer& operator=(const SecretBuffer&) = delete;
  SecretBuffer(SecretBuffer&& other) noexcept;
  SecretBuffer& operator=(SecretBuffer&& other) noexcept;
  ~SecretBuffer();

  // Zero the bytes in place. size() is reset to 0 but the allocation is kept
  // until destruction so that callers holding data() observe the zeroes.
  void Wipe() noexcept;

  bool empty() const noexcept { return size_ == 0; }
  std::size_t size() const noexcept { return size_; }
  const std::uint8_t* data() const noexcept { return bytes_.data(); }
  std::size_t capacity() const noexcept { return bytes_.size(); }

  std::string_view view() const noexcept {
    return std::string_view(reinterpret_cast<const char*>(bytes_.data()), size_);
  }
  std::span<const std::uint8_t> bytes() const noexcept {
    return std::span<const std::uint8_t>(bytes_.data(), size_);
  }

 private:
  std::vector<std::uint8_t> bytes_;
  std::size_t size_{0};
};

}  // namespace dappvault::util
