/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/buffer.hpp"

#include <sstream>

#include <gtest/gtest.h>
#include <testutil/literals.hpp>

using namespace seedphrase::common;

/**
 * @given salt prefix of seed derivation
 * @when prefix and passphrase are put into buffer
 * @then buffer holds their bytes in order
 */
TEST(BufferTest, PutStrings) {
  Buffer salt;
  EXPECT_EQ(salt.toHex(), "");

  auto &same = salt.put("mnemonic");
  EXPECT_EQ(&same, &salt);
  salt.put("TREZOR").put("");

  EXPECT_EQ(salt.size(), 14);
  EXPECT_EQ(salt.view(), BufferView::fromString("mnemonicTREZOR"));
  EXPECT_EQ(salt.toHex(), "6d6e656d6f6e69635452455a4f52");
}

/**
 * @given hex strings, well formed and malformed
 * @when buffer is created from them
 * @then only well formed ones are decoded
 */
TEST(BufferTest, FromHex) {
  EXPECT_EQ(Buffer::fromHex("0102ff").value(), (Buffer{1, 2, 255}));
  EXPECT_TRUE(Buffer::fromHex(""));
  EXPECT_FALSE(Buffer::fromHex("abc"));
  EXPECT_FALSE(Buffer::fromHex("zz"));
}

/**
 * @given buffer
 * @when buffer and its view are printed
 * @then both print the same hex
 */
TEST(BufferTest, Print) {
  auto b = "c0ffee"_unhex;
  std::stringstream buffer_out;
  std::stringstream view_out;
  buffer_out << b;
  view_out << b.view();
  EXPECT_EQ(buffer_out.str(), "c0ffee");
  EXPECT_EQ(view_out.str(), buffer_out.str());
}
