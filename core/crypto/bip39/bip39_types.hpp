/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <bitset>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/bip39/const.hpp"
#include "outcome/outcome.hpp"

namespace seedphrase::crypto::bip39 {
  namespace constants {
    constexpr size_t BIP39_SEED_LEN_512 = 64u;
  }  // namespace constants

  using Bip39Seed = common::Blob<constants::BIP39_SEED_LEN_512>;

  /// index of a word in a dictionary, one 11-bit group of checksummed entropy
  struct EntropyToken : public std::bitset<kWordBits> {
    using Parent = std::bitset<kWordBits>;
    using Parent::bitset;
  };

  enum class Bip39Error {
    INVALID_ENTROPY_LENGTH = 1,
    INVALID_MNEMONIC_LENGTH,
    UNKNOWN_WORD,
    CHECKSUM_MISMATCH,
    RANDOM_SOURCE_FAILURE,
  };
}  // namespace seedphrase::crypto::bip39

OUTCOME_HPP_DECLARE_ERROR(seedphrase::crypto::bip39, Bip39Error);

namespace seedphrase::crypto::bip39 {
  /**
   * @brief checks that entropy is 128 to 256 bits long, multiple of 32
   * @return Bip39Error::INVALID_ENTROPY_LENGTH otherwise
   */
  outcome::result<void> validateEntropyBitSize(size_t bits);

  /**
   * @brief checks that mnemonic has 12, 15, 18, 21 or 24 words
   * @return Bip39Error::INVALID_MNEMONIC_LENGTH otherwise
   */
  outcome::result<void> validateWordsCount(size_t words_count);
}  // namespace seedphrase::crypto::bip39
