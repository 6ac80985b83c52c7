/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <vector>

#include "common/buffer.hpp"
#include "crypto/bip39/bip39_types.hpp"
#include "outcome/outcome.hpp"

namespace seedphrase::crypto::bip39 {

  enum class BitPackerError {
    VALUE_TOO_LARGE = 1,
  };

  /**
   * @class BitPacker is an unsigned integer of up to kMaxChecksummedBytes
   * bytes stored big-endian. Checksummed entropy is treated as such an
   * integer, which is shifted and masked to move between bytes and 11-bit
   * word indices.
   */
  class BitPacker {
   public:
    static constexpr size_t kCapacity = kMaxChecksummedBytes;

    BitPacker() = default;

    /**
     * @brief loads integer from its big-endian representation
     * @param bytes at most kCapacity bytes
     */
    static outcome::result<BitPacker> fromBytes(common::BufferView bytes);

    /// multiplies by 2^bits, bits moved past capacity are lost
    void shiftLeft(size_t bits);

    /// divides by 2^bits
    void shiftRight(size_t bits);

    /// sets bits of value in the lowest bits of integer
    void orLow(uint16_t value);

    /// @return lowest {@param bits} bits, no more than 16
    uint16_t low(size_t bits) const;

    /**
     * @return big-endian representation left-padded to {@param size} bytes
     * @note value must fit in size bytes
     */
    common::Buffer toBytes(size_t size) const;

   private:
    std::array<uint8_t, kCapacity> bytes_{};
  };

  /**
   * @brief splits checksummed entropy into 11-bit groups, most significant
   * group first
   * @param checksummed big-endian checksummed entropy
   * @param tokens_count number of groups to extract
   */
  outcome::result<std::vector<EntropyToken>> splitIntoTokens(
      common::BufferView checksummed, size_t tokens_count);

}  // namespace seedphrase::crypto::bip39

OUTCOME_HPP_DECLARE_ERROR(seedphrase::crypto::bip39, BitPackerError);
