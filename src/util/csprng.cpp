#include "util/csprng.hpp"

#include <cstring>
#include <stdexcept>
#include <string_view>

#ifdef _WIN32
#include <windows.h>
#include <bcrypt.h>
#else
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/random.h>
#endif
#endif

namespace dappvault::util {

namespace {

#ifndef _WIN32
bool ReadDevUrandom(std::span<std::uint8_t> out, std::size_t filled, std::string* error) {
  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (error) {
      *error = std::string("open(/dev/urandom) failed: ") + std::strerror(errno);
    }
    return false;
  }
  while (filled < out.size()) {
    const ssize_t n = ::read(fd, out.data() + filled, out.size() - filled);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      if (error) {
        *error = n == 0 ? std::string("read(/dev/urandom) returned EOF")
                        : std::string("read(/dev/urandom) failed: ") + std::strerror(errno);
      }
      ::close(fd);
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  ::close(fd);
  return true;
}
#endif

}  // namespace

bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error) {
  if (out.empty()) {
    return true;
  }
#ifdef _WIN32
  const NTSTATUS status =
      BCryptGenRandom(nullptr, out.data(), static_cast<ULONG>(out.size()),
                      BCRYPT_USE_SYSTEM_PREFERRED_RNG);
  if (status != 0) {
    if (error) {
      *error = "BCryptGenRandom failed";
    }
    return false;
  }
  return true;
#else
  std::size_t filled = 0;
#if defined(__linux__)
  while (filled < out.size()) {
    const ssize_t n = getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    filled += static_cast<std::size_t>(n);
  }
  if (filled == out.size()) {
    return true;
  }
#endif
  return ReadDevUrandom(out, filled, error);
#endif
}

std::vector<std::uint8_t> SecureRandomBytes(std::size_t size) {
  std::vector<std::uint8_t> out(size);
  std::string error;
  if (!FillSecureRandomBytes(out, &error)) {
    throw std::runtime_error("secure randomness unavailable: " + error);
  }
  return out;
}

std::string SecureRandomString(std::size_t length, std::string_view alphabet) {
  if (alphabet.empty() || alphabet.size() > 256) {
    throw std::invalid_argument("alphabet size out of range");
  }
  // Rejection sampling keeps the distribution uniform for any alphabet size.
  const std::size_t limit = 256 - (256 % alphabet.size());
  std::string out;
  out.reserve(length);
  while (out.size() < length) {
    const auto pool = SecureRandomBytes(length * 2);
    for (auto byte : pool) {
      if (byte >= limit) {
        continue;
      }
      out.push_back(alphabet[byte % alphabet.size()]);
      if (out.size() == length) {
        break;
      }
    }
  }
  return out;
}

}  // namespace dappvault::util
