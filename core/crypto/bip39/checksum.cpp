/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/checksum.hpp"

#include "crypto/bip39/bit_packer.hpp"
#include "crypto/sha/sha256.hpp"

namespace seedphrase::crypto::bip39 {

  outcome::result<common::Buffer> addChecksum(common::BufferView entropy) {
    const size_t entropy_bits = entropy.size() * 8;
    OUTCOME_TRY(validateEntropyBitSize(entropy_bits));

    const uint8_t checksum_byte = sha256(entropy)[0];
    OUTCOME_TRY(packer, BitPacker::fromBytes(entropy));

    // move bits of the hash in one by one, starting from the most
    // significant
    const size_t checksum_bits = checksumBitsCount(entropy_bits);
    for (size_t i = 0; i < checksum_bits; ++i) {
      packer.shiftLeft(1);
      if ((checksum_byte & (1u << (7 - i))) != 0) {
        packer.orLow(1);
      }
    }

    return packer.toBytes(entropy.size() + 1);
  }

  outcome::result<common::Buffer> stripChecksum(
      common::BufferView checksummed) {
    if (checksummed.empty()) {
      return Bip39Error::INVALID_ENTROPY_LENGTH;
    }
    const size_t entropy_size = checksummed.size() - 1;
    OUTCOME_TRY(validateEntropyBitSize(entropy_size * 8));

    // checksummed value is entropy_size * 8 + checksum_bits wide, the rest of
    // the leading byte is padding
    const size_t checksum_bits = checksumBitsCount(entropy_size * 8);
    if ((checksummed[0] >> checksum_bits) != 0) {
      return Bip39Error::INVALID_ENTROPY_LENGTH;
    }

    OUTCOME_TRY(packer, BitPacker::fromBytes(checksummed));
    packer.shiftRight(checksum_bits);
    return packer.toBytes(entropy_size);
  }

}  // namespace seedphrase::crypto::bip39
