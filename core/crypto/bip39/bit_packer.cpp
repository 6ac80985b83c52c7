/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/bit_packer.hpp"

#include <algorithm>

#include <boost/assert.hpp>

namespace seedphrase::crypto::bip39 {

  outcome::result<BitPacker> BitPacker::fromBytes(common::BufferView bytes) {
    if (bytes.size() > kCapacity) {
      return BitPackerError::VALUE_TOO_LARGE;
    }
    BitPacker packer;
    std::copy(bytes.begin(),
              bytes.end(),
              packer.bytes_.begin() + (kCapacity - bytes.size()));
    return packer;
  }

  void BitPacker::shiftLeft(size_t bits) {
    const size_t byte_shift = bits / 8;
    const size_t bit_shift = bits % 8;
    // destination index never exceeds source one, so go from the top
    for (size_t i = 0; i < kCapacity; ++i) {
      const size_t src = i + byte_shift;
      const uint8_t hi = src < kCapacity ? bytes_[src] : 0;
      const uint8_t lo = src + 1 < kCapacity ? bytes_[src + 1] : 0;
      bytes_[i] = bit_shift == 0
                    ? hi
                    : static_cast<uint8_t>((hi << bit_shift)
                                           | (lo >> (8 - bit_shift)));
    }
  }

  void BitPacker::shiftRight(size_t bits) {
    const size_t byte_shift = bits / 8;
    const size_t bit_shift = bits % 8;
    for (size_t i = kCapacity; i-- > 0;) {
      const uint8_t lo = i >= byte_shift ? bytes_[i - byte_shift] : 0;
      const uint8_t hi = i >= byte_shift + 1 ? bytes_[i - byte_shift - 1] : 0;
      bytes_[i] = bit_shift == 0
                    ? lo
                    : static_cast<uint8_t>((lo >> bit_shift)
                                           | (hi << (8 - bit_shift)));
    }
  }

  void BitPacker::orLow(uint16_t value) {
    bytes_[kCapacity - 1] |= static_cast<uint8_t>(value & 0xFFu);
    bytes_[kCapacity - 2] |= static_cast<uint8_t>(value >> 8u);
  }

  uint16_t BitPacker::low(size_t bits) const {
    BOOST_ASSERT(bits <= 16);
    const uint32_t tail = (static_cast<uint32_t>(bytes_[kCapacity - 3]) << 16u)
                        | (static_cast<uint32_t>(bytes_[kCapacity - 2]) << 8u)
                        | bytes_[kCapacity - 1];
    return static_cast<uint16_t>(tail & ((1u << bits) - 1u));
  }

  common::Buffer BitPacker::toBytes(size_t size) const {
    BOOST_ASSERT(size <= kCapacity);
    BOOST_ASSERT_MSG(std::all_of(bytes_.begin(),
                                 bytes_.begin() + (kCapacity - size),
                                 [](uint8_t b) { return b == 0; }),
                     "value does not fit requested size");
    return common::Buffer(bytes_.begin() + (kCapacity - size), bytes_.end());
  }

  outcome::result<std::vector<EntropyToken>> splitIntoTokens(
      common::BufferView checksummed, size_t tokens_count) {
    OUTCOME_TRY(packer, BitPacker::fromBytes(checksummed));

    // take the lowest 11 bits and fill the result from its end, so the
    // first extracted group becomes the last word
    std::vector<EntropyToken> tokens(tokens_count);
    for (size_t i = tokens_count; i-- > 0;) {
      tokens[i] = EntropyToken(packer.low(kWordBits));
      packer.shiftRight(kWordBits);
    }
    return tokens;
  }

}  // namespace seedphrase::crypto::bip39

OUTCOME_CPP_DEFINE_CATEGORY(seedphrase::crypto::bip39, BitPackerError, e) {
  using E = seedphrase::crypto::bip39::BitPackerError;
  switch (e) {
    case E::VALUE_TOO_LARGE:
      return "value does not fit the checksummed entropy capacity";
  }
  return "unknown BitPackerError";
}
