/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "crypto/bip39/bip39_types.hpp"
#include "crypto/bip39/bit_packer.hpp"
#include "outcome/outcome.hpp"

namespace seedphrase::crypto::bip39 {

  enum class Bip39EntropyError {
    STORAGE_NOT_COMPLETE = 1,
    STORAGE_IS_FULL,
  };

  /**
   * @class EntropyAccumulator rebuilds checksummed entropy from word indices
   * of a mnemonic, the inverse of splitIntoTokens()
   */
  class EntropyAccumulator {
   public:
    /**
     * @brief create class instance
     * @param words_count number of words in mnemonic phrase
     * @return accumulator or Bip39Error::INVALID_MNEMONIC_LENGTH
     */
    static outcome::result<EntropyAccumulator> create(size_t words_count);

    /**
     * @brief append a new entropy token as the least significant 11 bits
     * @param value token
     * @return success or error if storage is full
     */
    outcome::result<void> append(const EntropyToken &value);

    /**
     * @return entropy with checksum bits at the low end, big-endian, padded
     * to entropy size + 1 bytes
     */
    outcome::result<common::Buffer> getChecksummedEntropy() const;

    /**
     * @return entropy alone, with checksum bits dropped
     */
    outcome::result<common::Buffer> getEntropy() const;

    size_t checksumBitsCount() const {
      return checksum_bits_count_;
    }

   private:
    /**
     * @param words_count number of 11-bit tokens to accumulate
     * @param checksum_bits_count number of bits in checksum
     */
    EntropyAccumulator(size_t words_count, size_t checksum_bits_count);

    BitPacker value_;
    size_t appended_ = 0;
    size_t words_count_;
    size_t checksum_bits_count_;
  };
}  // namespace seedphrase::crypto::bip39

OUTCOME_HPP_DECLARE_ERROR(seedphrase::crypto::bip39, Bip39EntropyError);
