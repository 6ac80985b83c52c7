/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/entropy_accumulator.hpp"

#include <boost/assert.hpp>

namespace seedphrase::crypto::bip39 {

  namespace {
    /// size in bytes of checksummed entropy of given bits count
    size_t fullByteSize(size_t total_bits, size_t checksum_bits) {
      return (total_bits - checksum_bits) / 8 + 1;
    }
  }  // namespace

  outcome::result<EntropyAccumulator> EntropyAccumulator::create(
      size_t words_count) {
    OUTCOME_TRY(validateWordsCount(words_count));
    const size_t total_bits = words_count * kWordBits;
    return EntropyAccumulator(words_count, total_bits % kEntropyBitsStep);
  }

  outcome::result<void> EntropyAccumulator::append(const EntropyToken &value) {
    if (appended_ == words_count_) {
      return Bip39EntropyError::STORAGE_IS_FULL;
    }

    // value * 2048 + index
    value_.shiftLeft(kWordBits);
    value_.orLow(static_cast<uint16_t>(value.to_ulong()));
    ++appended_;

    return outcome::success();
  }

  outcome::result<common::Buffer> EntropyAccumulator::getChecksummedEntropy()
      const {
    if (appended_ != words_count_) {
      return Bip39EntropyError::STORAGE_NOT_COMPLETE;
    }
    return value_.toBytes(
        fullByteSize(words_count_ * kWordBits, checksum_bits_count_));
  }

  outcome::result<common::Buffer> EntropyAccumulator::getEntropy() const {
    if (appended_ != words_count_) {
      return Bip39EntropyError::STORAGE_NOT_COMPLETE;
    }

    const size_t full_size =
        fullByteSize(words_count_ * kWordBits, checksum_bits_count_);
    const size_t entropy_size = full_size - full_size % 4;

    auto entropy = value_;
    entropy.shiftRight(checksum_bits_count_);
    return entropy.toBytes(entropy_size);
  }

  EntropyAccumulator::EntropyAccumulator(size_t words_count,
                                         size_t checksum_bits_count)
      : words_count_{words_count}, checksum_bits_count_{checksum_bits_count} {
    BOOST_ASSERT_MSG((words_count * kWordBits - checksum_bits_count)
                             % kEntropyBitsStep
                         == 0,
                     "invalid bits count");
    BOOST_ASSERT_MSG(words_count * kWordBits <= BitPacker::kCapacity * 8,
                     "unsupported bits count");
  }

}  // namespace seedphrase::crypto::bip39

OUTCOME_CPP_DEFINE_CATEGORY(seedphrase::crypto::bip39, Bip39EntropyError, e) {
  using E = seedphrase::crypto::bip39::Bip39EntropyError;
  switch (e) {
    case E::STORAGE_NOT_COMPLETE:
      return "cannot get info from storage while it is still not complete";
    case E::STORAGE_IS_FULL:
      return "cannot put more data into storage, it is full";
  }

  return "unknown Bip39EntropyError error";
}
