#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include "util/csprng.hpp"
#include "util/secure_wipe.hpp"

using dappvault::util::SecretBuffer;

namespace {

bool AllZero(const SecretBuffer& buffer) {
  for (std::size_t i = 0; i < buffer.capacity(); ++i) {
    if (buffer.data()[i] != 0) {
      return false;
    }
  }
  return true;
}

}  // namespace

int main() {
  try {
    {
      SecretBuffer secret(std::string("APrivateKey1secret"));
      if (secret.view() != "APrivateKey1secret" || secret.size() != 18) {
        std::cerr << "secret_buffer_tests: contents not preserved\n";
        return EXIT_FAILURE;
      }
      const auto capacity = secret.capacity();
      secret.Wipe();
      if (!secret.empty() || secret.capacity() != capacity || !AllZero(secret)) {
        std::cerr << "secret_buffer_tests: Wipe() must zero storage in place\n";
        return EXIT_FAILURE;
      }
    }

    {
      SecretBuffer first(std::string("view-key"));
      SecretBuffer second(std::move(first));
      if (second.view() != "view-key" || !first.empty()) {
        std::cerr << "secret_buffer_tests: move must transfer ownership\n";
        return EXIT_FAILURE;
      }
      SecretBuffer third(std::string("other"));
      third = std::move(second);
      if (third.view() != "view-key") {
        std::cerr << "secret_buffer_tests: move assignment lost the value\n";
        return EXIT_FAILURE;
      }
    }

    {
      std::string text = "password123";
      dappvault::util::SecureWipe(text);
      if (!text.empty()) {
        std::cerr << "secret_buffer_tests: wiped string should be empty\n";
        return EXIT_FAILURE;
      }
    }

    {
      const auto id = dappvault::util::SecureRandomString(9, "0123456789abcdefghijklmnopqrstuvwxyz");
      if (id.size() != 9 || id.find_first_not_of("0123456789abcdefghijklmnopqrstuvwxyz") !=
                                std::string::npos) {
        std::cerr << "secret_buffer_tests: random id has wrong shape: " << id << "\n";
        return EXIT_FAILURE;
      }
      const auto a = dappvault::util::SecureRandomBytes(16);
      const auto b = dappvault::util::SecureRandomBytes(16);
      if (a.size() != 16 || a == b) {
        std::cerr << "secret_buffer_tests: random salts should differ\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "secret_buffer_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
