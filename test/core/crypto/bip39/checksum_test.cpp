/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/checksum.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace seedphrase;
using namespace crypto::bip39;

/**
 * @given supported entropy sizes
 * @then checksum has entropy_bits/32 bits
 */
TEST(ChecksumTest, BitsCount) {
  EXPECT_EQ(checksumBitsCount(128), 4);
  EXPECT_EQ(checksumBitsCount(160), 5);
  EXPECT_EQ(checksumBitsCount(192), 6);
  EXPECT_EQ(checksumBitsCount(224), 7);
  EXPECT_EQ(checksumBitsCount(256), 8);
}

/**
 * @given 16 zero bytes, sha256 of which starts with 0x37
 * @when checksum is added
 * @then 4 high bits of 0x37 are appended to the entropy
 */
TEST(ChecksumTest, ZeroEntropy) {
  EXPECT_OUTCOME_TRUE(checksummed,
                      addChecksum("00000000000000000000000000000000"_unhex));
  EXPECT_EQ(checksummed, "0000000000000000000000000000000003"_unhex);
}

/**
 * @given entropy which is not byte-aligned after checksum is appended
 * @when checksum is added
 * @then all entropy bits are shifted by checksum size
 */
TEST(ChecksumTest, ShiftedEntropy) {
  EXPECT_OUTCOME_TRUE(checksummed,
                      addChecksum("7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f"_unhex));
  EXPECT_EQ(checksummed, "07f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f8"_unhex);

  EXPECT_OUTCOME_TRUE(
      checksummed_224,
      addChecksum(
          "ffffffffffffffffffffffffffffffffffffffffffffffffffffffff"_unhex));
  EXPECT_EQ(
      checksummed_224,
      "7fffffffffffffffffffffffffffffffffffffffffffffffffffffff99"_unhex);
}

/**
 * @given 32 bytes of entropy
 * @when checksum is added
 * @then the whole first byte of hash is appended
 */
TEST(ChecksumTest, FullChecksumByte) {
  EXPECT_OUTCOME_TRUE(
      checksummed,
      addChecksum(
          "7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f"_unhex));
  EXPECT_EQ(
      checksummed,
      "7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f17"_unhex);
}

/**
 * @given entropy of unsupported sizes
 * @when checksum is added
 * @then INVALID_ENTROPY_LENGTH is returned
 */
TEST(ChecksumTest, UnsupportedEntropy) {
  EXPECT_EC(addChecksum(Buffer(12, 0)), Bip39Error::INVALID_ENTROPY_LENGTH);
  EXPECT_EC(addChecksum(Buffer(17, 0)), Bip39Error::INVALID_ENTROPY_LENGTH);
  EXPECT_EC(addChecksum(Buffer(36, 0)), Bip39Error::INVALID_ENTROPY_LENGTH);
}

/**
 * @given checksummed entropy of each supported size
 * @when checksum is stripped
 * @then original entropy is returned
 */
TEST(ChecksumTest, StripChecksum) {
  for (size_t size : {16, 20, 24, 28, 32}) {
    Buffer entropy(size, 0);
    for (size_t i = 0; i < size; ++i) {
      entropy[i] = static_cast<uint8_t>(0xA5 ^ (i * 29));
    }
    EXPECT_OUTCOME_TRUE(checksummed, addChecksum(entropy));
    ASSERT_EQ(checksummed.size(), size + 1);
    EXPECT_OUTCOME_TRUE(stripped, stripChecksum(checksummed));
    EXPECT_EQ(stripped, entropy) << "entropy size " << size;
  }
}

/**
 * @given bytes of unsupported size or with bits above checksummed width
 * @when checksum is stripped
 * @then INVALID_ENTROPY_LENGTH is returned
 */
TEST(ChecksumTest, StripChecksumMalformed) {
  EXPECT_EC(stripChecksum(Buffer{}), Bip39Error::INVALID_ENTROPY_LENGTH);
  EXPECT_EC(stripChecksum(Buffer(16, 0)), Bip39Error::INVALID_ENTROPY_LENGTH);
  // 132 bits fit in 17 bytes only with 4 leading zero bits
  EXPECT_EC(stripChecksum("1000000000000000000000000000000003"_unhex),
            Bip39Error::INVALID_ENTROPY_LENGTH);
}
