#include "util/argon2_kdf.hpp"

#include <argon2.h>

namespace dappvault::util {

Argon2idParams DefaultArgon2idParams() {
  Argon2idParams params;
  params.t_cost = 3;
  params.m_cost_kib = 64 * 1024;
  params.parallelism = 1;
  return params;
}

bool ValidateArgon2idParams(const Argon2idParams& params, std::string* error) {
  auto fail = [&](const char* message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (params.t_cost == 0 || params.t_cost > kArgon2MaxTimeCost) {
    return fail("argon2 t_cost out of range");
  }
  if (params.parallelism == 0 || params.parallelism > kArgon2MaxParallelism) {
    return fail("argon2 parallelism out of range");
  }
  if (params.m_cost_kib < 8 * params.parallelism || params.m_cost_kib > kArgon2MaxMemoryKib) {
    return fail("argon2 m_cost out of range");
  }
  return true;
}

bool DeriveKeyArgon2id(std::span<const std::uint8_t> password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::vector<std::uint8_t>* key_out,
                       std::string* error) {
  if (!key_out) return false;
  if (!ValidateArgon2idParams(params, error)) {
    return false;
  }
  if (key_out->empty()) {
    key_out->assign(32, 0);
  }

  const int rc = argon2id_hash_raw(
      params.t_cost,
      params.m_cost_kib,
      params.parallelism,
      password.data(), password.size(),
      salt.data(), salt.size(),
      key_out->data(), key_out->size());

  if (rc != ARGON2_OK) {
    if (error) {
      *error = argon2_error_message(rc);
    }
    return false;
  }
  return true;
}

}  // namespace dappvault::util
