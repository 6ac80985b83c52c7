/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "crypto/bip39/bip39_types.hpp"

namespace seedphrase::crypto::bip39 {

  /// number of checksum bits appended to entropy of given size
  constexpr size_t checksumBitsCount(size_t entropy_bits) {
    return entropy_bits / kEntropyBitsStep;
  }

  /**
   * @brief appends the first entropy_bits/32 bits of sha256(entropy) to the
   * low end of entropy
   * @param entropy 16, 20, 24, 28 or 32 bytes
   * @return checksummed entropy as big-endian integer of entropy.size() + 1
   * bytes
   */
  outcome::result<common::Buffer> addChecksum(common::BufferView entropy);

  /**
   * @brief drops checksum bits from checksummed entropy, without verifying
   * them
   * @param checksummed output of addChecksum() or
   * MnemonicCodec::unmarshalEntropy(), 17, 21, 25, 29 or 33 bytes
   * @return pure entropy
   */
  outcome::result<common::Buffer> stripChecksum(
      common::BufferView checksummed);

}  // namespace seedphrase::crypto::bip39
