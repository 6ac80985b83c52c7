/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "crypto/bip39/bip39_types.hpp"
#include "outcome/outcome.hpp"

namespace seedphrase::crypto::bip39 {

  enum class DictionaryError {
    WRONG_WORDS_COUNT = 1,
    DUPLICATE_WORD,
    EMPTY_WORD,
  };

  /**
   * @class Dictionary keeps and provides correspondence between mnemonic words
   * and entropy value. Both directions are built once from the same ordered
   * list and never change afterwards, so an instance is shared between
   * threads without synchronization.
   */
  class Dictionary {
   public:
    Dictionary(const Dictionary &) = delete;
    Dictionary(Dictionary &&) = delete;
    Dictionary &operator=(const Dictionary &) = delete;
    Dictionary &operator=(Dictionary &&) = delete;
    ~Dictionary() = default;

    /**
     * @brief builds dictionary of a language
     * @param words exactly 2048 unique non-empty words, word index is its
     * position in the list
     */
    static outcome::result<std::shared_ptr<const Dictionary>> create(
        std::vector<std::string> words);

    /**
     * @return english dictionary, built on first call
     */
    static std::shared_ptr<const Dictionary> english();

    /**
     * @brief looks for word in dictionary
     * @param word word to look for
     * @return entropy value or Bip39Error::UNKNOWN_WORD if not found
     */
    outcome::result<EntropyToken> findValue(std::string_view word) const;

    /**
     * @return word of the given entropy value
     */
    std::string_view findWord(const EntropyToken &token) const;

    bool contains(std::string_view word) const;

   private:
    // only create() constructs, after the word list is validated
    explicit Dictionary(std::vector<std::string> words);

    std::vector<std::string> words_;
    // keys point into words_
    std::unordered_map<std::string_view, EntropyToken> entropy_map_;
  };
}  // namespace seedphrase::crypto::bip39

OUTCOME_HPP_DECLARE_ERROR(seedphrase::crypto::bip39, DictionaryError);
