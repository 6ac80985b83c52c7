/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "common/buffer_view.hpp"
#include "testutil/outcome.hpp"

using namespace seedphrase::common;

/**
 * @given checksummed entropy of a 12-word mnemonic
 * @when it is encoded to hex
 * @then lowercase digits without prefix are returned
 */
TEST(HexutilTest, EncodeLowercase) {
  std::vector<uint8_t> bytes{0x7f, 0x7f, 0x7f, 0x7f, 0x7f, 0x7f, 0x7f, 0x7f,
                             0x7f, 0x7f, 0x7f, 0x7f, 0x7f, 0x7f, 0x7f, 0x7f,
                             0x7a};
  EXPECT_EQ(hex_lower(bytes), "7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7a");
  EXPECT_EQ(hex_lower(BufferView{}), "");
}

/**
 * @given hex in upper, lower and mixed case
 * @when it is decoded
 * @then the same bytes are returned
 */
TEST(HexutilTest, DecodeAnyCase) {
  std::vector<uint8_t> expected{0xde, 0xad, 0xbe, 0xef};
  EXPECT_OUTCOME_TRUE(lower, unhex("deadbeef"));
  EXPECT_EQ(lower, expected);
  EXPECT_OUTCOME_TRUE(mixed, unhex("DeAdBeEf"));
  EXPECT_EQ(mixed, expected);
  EXPECT_OUTCOME_TRUE(empty, unhex(""));
  EXPECT_TRUE(empty.empty());
}

/**
 * @given malformed hex
 * @when it is decoded
 * @then the kind of malformation is reported
 */
TEST(HexutilTest, DecodeMalformed) {
  EXPECT_EC(unhex("abc"), UnhexError::NOT_ENOUGH_INPUT);
  EXPECT_EC(unhex("0x00"), UnhexError::NON_HEX_INPUT);
  EXPECT_EC(unhex("ab cd"), UnhexError::NON_HEX_INPUT);
}
