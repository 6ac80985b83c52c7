/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/bip39_types.hpp"

namespace seedphrase::crypto::bip39 {
  outcome::result<void> validateEntropyBitSize(size_t bits) {
    if (bits % kEntropyBitsStep != 0 or bits < kMinEntropyBits
        or bits > kMaxEntropyBits) {
      return Bip39Error::INVALID_ENTROPY_LENGTH;
    }
    return outcome::success();
  }

  outcome::result<void> validateWordsCount(size_t words_count) {
    if (words_count % kWordsCountStep != 0 or words_count < kMinWordsCount
        or words_count > kMaxWordsCount) {
      return Bip39Error::INVALID_MNEMONIC_LENGTH;
    }
    return outcome::success();
  }
}  // namespace seedphrase::crypto::bip39

OUTCOME_CPP_DEFINE_CATEGORY(seedphrase::crypto::bip39, Bip39Error, e) {
  using E = seedphrase::crypto::bip39::Bip39Error;
  switch (e) {
    case E::INVALID_ENTROPY_LENGTH:
      return "entropy length must be 128 to 256 bits and a multiple of 32";
    case E::INVALID_MNEMONIC_LENGTH:
      return "mnemonic must consist of 12, 15, 18, 21 or 24 words";
    case E::UNKNOWN_WORD:
      return "mnemonic contains a word missing from the dictionary";
    case E::CHECKSUM_MISMATCH:
      return "mnemonic checksum does not match its entropy";
    case E::RANDOM_SOURCE_FAILURE:
      return "random source failed to provide entropy";
  }
  return "unknown Bip39Error";
}
