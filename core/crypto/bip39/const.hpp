/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string_view>

namespace seedphrase::crypto::bip39 {
  constexpr size_t kWordBits = 11;
  constexpr size_t kDictionaryWords = 1 << kWordBits;

  constexpr size_t kEntropyBitsStep = 32;
  constexpr size_t kMinEntropyBits = 128;
  constexpr size_t kMaxEntropyBits = 256;

  constexpr size_t kWordsCountStep = 3;
  constexpr size_t kMinWordsCount = 12;
  constexpr size_t kMaxWordsCount = 24;

  /// longest entropy plus one byte with up to 8 checksum bits
  constexpr size_t kMaxChecksummedBytes = kMaxEntropyBits / 8 + 1;

  constexpr size_t kSeedIterations = 2048;
  constexpr std::string_view kSeedSaltPrefix = "mnemonic";
}  // namespace seedphrase::crypto::bip39
