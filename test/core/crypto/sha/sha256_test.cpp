/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"

using seedphrase::common::BufferView;
using seedphrase::crypto::sha256;

/**
 * @given some well-known strings
 * @when hashing them with sha256
 * @then the result is equal to the reference hash
 */
TEST(Sha256Test, Valid) {
  EXPECT_EQ(
      sha256("").toHex(),
      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(
      sha256("abc").toHex(),
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

/**
 * @given string and its bytes
 * @when both are hashed
 * @then hashes are equal
 */
TEST(Sha256Test, StringAndBytesAgree) {
  std::string_view str = "abc";
  EXPECT_EQ(sha256(str), sha256(BufferView::fromString(str)));
}

/**
 * @given 16 zero bytes
 * @when hashing them
 * @then first byte of the hash is 0x37
 */
TEST(Sha256Test, ZeroEntropyChecksumByte) {
  EXPECT_EQ(sha256("00000000000000000000000000000000"_unhex)[0], 0x37);
}
