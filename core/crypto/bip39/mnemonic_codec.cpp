/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/mnemonic_codec.hpp"

#include <boost/assert.hpp>

#include "crypto/bip39/bit_packer.hpp"
#include "crypto/bip39/checksum.hpp"
#include "crypto/bip39/entropy_accumulator.hpp"
#include "crypto/bip39/mnemonic.hpp"

namespace seedphrase::crypto::bip39 {

  MnemonicCodec::MnemonicCodec(std::shared_ptr<const Dictionary> dictionary)
      : dictionary_{std::move(dictionary)} {
    BOOST_ASSERT(dictionary_ != nullptr);
  }

  outcome::result<MnemonicCodec> MnemonicCodec::create(
      std::vector<std::string> words) {
    OUTCOME_TRY(dictionary, Dictionary::create(std::move(words)));
    return MnemonicCodec{std::move(dictionary)};
  }

  MnemonicCodec MnemonicCodec::english() {
    return MnemonicCodec{Dictionary::english()};
  }

  outcome::result<std::string> MnemonicCodec::marshalEntropy(
      common::BufferView entropy) const {
    const size_t entropy_bits = entropy.size() * 8;
    OUTCOME_TRY(validateEntropyBitSize(entropy_bits));

    const size_t words_count =
        (entropy_bits + checksumBitsCount(entropy_bits)) / kWordBits;

    OUTCOME_TRY(checksummed, addChecksum(entropy));
    OUTCOME_TRY(tokens, splitIntoTokens(checksummed, words_count));

    std::string phrase;
    for (const auto &token : tokens) {
      if (not phrase.empty()) {
        phrase += ' ';
      }
      phrase += dictionary_->findWord(token);
    }
    return phrase;
  }

  outcome::result<common::Buffer> MnemonicCodec::unmarshalEntropy(
      std::string_view mnemonic) const {
    OUTCOME_TRY(parsed, Mnemonic::parse(mnemonic));
    if (firstUnknownWord(parsed.words).has_value()) {
      return Bip39Error::UNKNOWN_WORD;
    }
    OUTCOME_TRY(accumulator, EntropyAccumulator::create(parsed.words.size()));

    for (const auto &word : parsed.words) {
      OUTCOME_TRY(token, dictionary_->findValue(word));
      OUTCOME_TRY(accumulator.append(token));
    }

    OUTCOME_TRY(checksummed, accumulator.getChecksummedEntropy());
    OUTCOME_TRY(entropy, accumulator.getEntropy());

    OUTCOME_TRY(expected, addChecksum(entropy));
    if (expected != checksummed) {
      return Bip39Error::CHECKSUM_MISMATCH;
    }

    return checksummed;
  }

  outcome::result<common::Buffer> MnemonicCodec::entropyFromMnemonic(
      std::string_view mnemonic) const {
    OUTCOME_TRY(checksummed, unmarshalEntropy(mnemonic));
    return stripChecksum(checksummed);
  }

  bool MnemonicCodec::isMnemonicValid(std::string_view mnemonic) const {
    return unmarshalEntropy(mnemonic).has_value();
  }

  std::optional<UnknownWord> MnemonicCodec::findUnknownWord(
      std::string_view mnemonic) const {
    auto parsed = Mnemonic::parse(mnemonic);
    if (not parsed) {
      return std::nullopt;
    }
    auto &words = parsed.value().words;
    auto index = firstUnknownWord(words);
    if (not index) {
      return std::nullopt;
    }
    return UnknownWord{*index, std::move(words[*index])};
  }

  std::optional<size_t> MnemonicCodec::firstUnknownWord(
      const std::vector<std::string> &words) const {
    for (size_t i = 0; i < words.size(); ++i) {
      if (not dictionary_->contains(words[i])) {
        return i;
      }
    }
    return std::nullopt;
  }

}  // namespace seedphrase::crypto::bip39
