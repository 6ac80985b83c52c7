/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/buffer.hpp"
#include "crypto/bip39/dictionary.hpp"
#include "outcome/outcome.hpp"

namespace seedphrase::crypto::bip39 {

  /// word of a mnemonic missing from the dictionary
  struct UnknownWord {
    /// 0-based position among the words of the phrase
    size_t index;
    std::string word;

    bool operator==(const UnknownWord &) const = default;
  };

  /**
   * @class MnemonicCodec converts entropy to mnemonic phrase and back using
   * words of one dictionary. Stateless apart from the shared dictionary,
   * copies are cheap.
   */
  class MnemonicCodec {
   public:
    explicit MnemonicCodec(std::shared_ptr<const Dictionary> dictionary);

    /**
     * @brief makes codec of a custom wordlist
     * @param words exactly 2048 unique words
     */
    static outcome::result<MnemonicCodec> create(
        std::vector<std::string> words);

    /// codec of the english wordlist
    static MnemonicCodec english();

    /**
     * @brief encodes entropy as a mnemonic phrase
     * @param entropy 16, 20, 24, 28 or 32 bytes
     * @return words separated by single spaces
     */
    outcome::result<std::string> marshalEntropy(
        common::BufferView entropy) const;

    /**
     * @brief decodes mnemonic phrase and verifies its checksum
     * @param mnemonic words separated by whitespace
     * @return entropy with checksum bits appended at the low end, one byte
     * longer than the entropy; see stripChecksum(). On
     * Bip39Error::UNKNOWN_WORD the word is reported by findUnknownWord()
     */
    outcome::result<common::Buffer> unmarshalEntropy(
        std::string_view mnemonic) const;

    /**
     * @brief same as unmarshalEntropy(), but with checksum bits dropped
     * @return entropy that was marshalled into the mnemonic
     */
    outcome::result<common::Buffer> entropyFromMnemonic(
        std::string_view mnemonic) const;

    bool isMnemonicValid(std::string_view mnemonic) const;

    /**
     * @brief finds the first word of the phrase missing from the dictionary
     * @return std::nullopt if every word is known or the phrase has
     * unsupported number of words
     */
    std::optional<UnknownWord> findUnknownWord(
        std::string_view mnemonic) const;

    const Dictionary &dictionary() const {
      return *dictionary_;
    }

   private:
    std::optional<size_t> firstUnknownWord(
        const std::vector<std::string> &words) const;

    std::shared_ptr<const Dictionary> dictionary_;
  };

}  // namespace seedphrase::crypto::bip39
