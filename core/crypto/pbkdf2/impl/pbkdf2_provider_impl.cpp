/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/pbkdf2/impl/pbkdf2_provider_impl.hpp"

#include <limits>

#include <openssl/evp.h>

namespace seedphrase::crypto {

  outcome::result<common::Buffer> Pbkdf2ProviderImpl::deriveKey(
      common::BufferView data,
      common::BufferView salt,
      size_t iterations,
      size_t key_length) const {
    constexpr size_t kIntMax = std::numeric_limits<int>::max();
    if (data.size() > kIntMax or salt.size() > kIntMax or iterations == 0
        or iterations > kIntMax or key_length == 0 or key_length > kIntMax) {
      return Pbkdf2ProviderError::KEY_DERIVATION_FAILED;
    }

    common::Buffer out(key_length, 0);
    const auto *digest = EVP_sha512();

    int res = PKCS5_PBKDF2_HMAC(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<const char *>(data.data()),
        static_cast<int>(data.size()),
        salt.data(),
        static_cast<int>(salt.size()),
        static_cast<int>(iterations),
        digest,
        static_cast<int>(key_length),
        out.data());
    if (res != 1) {
      return Pbkdf2ProviderError::KEY_DERIVATION_FAILED;
    }

    return out;
  }
}  // namespace seedphrase::crypto

OUTCOME_CPP_DEFINE_CATEGORY(seedphrase::crypto, Pbkdf2ProviderError, error) {
  using Error = seedphrase::crypto::Pbkdf2ProviderError;
  switch (error) {
    case Error::KEY_DERIVATION_FAILED:
      return "failed to derive key";
  }
  return "unknown Pbkdf2ProviderError";
}
