/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/pbkdf2/impl/pbkdf2_provider_impl.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using seedphrase::common::Buffer;
using seedphrase::common::BufferView;
using seedphrase::crypto::Pbkdf2ProviderError;
using seedphrase::crypto::Pbkdf2ProviderImpl;

struct Pbkdf2ProviderTest : public ::testing::Test {
  Pbkdf2ProviderImpl provider;

  BufferView password = BufferView::fromString("password");
  BufferView salt = BufferView::fromString("salt");
};

/**
 * @given password and salt
 * @when one iteration of pbkdf2-hmac-sha512 is applied
 * @then reference key is derived
 */
TEST_F(Pbkdf2ProviderTest, SingleIteration) {
  EXPECT_OUTCOME_TRUE(key, provider.deriveKey(password, salt, 1, 64));
  EXPECT_EQ(key,
            "867f70cf1ade02cff3752599a3a53dc4af34c7a669815ae5d513554e1c8cf252"
            "c02d470a285a0501bad999bfe943c08f050235d7d68b1da55e63f73b60a57fce"_unhex);
}

/**
 * @given password and salt
 * @when two iterations are applied and shorter key is requested
 * @then reference key of requested length is derived
 */
TEST_F(Pbkdf2ProviderTest, TwoIterationsShortKey) {
  EXPECT_OUTCOME_TRUE(key, provider.deriveKey(password, salt, 2, 32));
  EXPECT_EQ(
      key,
      "e1d9c16aa681708a45f5c7c4e215ceb66e011a2e9f0040713f18aefdb866d53c"_unhex);
}

/**
 * @given zero iterations or zero key length
 * @when key is derived
 * @then KEY_DERIVATION_FAILED is returned
 */
TEST_F(Pbkdf2ProviderTest, InvalidParameters) {
  EXPECT_EC(provider.deriveKey(password, salt, 0, 64),
            Pbkdf2ProviderError::KEY_DERIVATION_FAILED);
  EXPECT_EC(provider.deriveKey(password, salt, 1, 0),
            Pbkdf2ProviderError::KEY_DERIVATION_FAILED);
}
