/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/dictionary.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "crypto/bip39/wordlist/english.hpp"

namespace seedphrase::crypto::bip39 {

  Dictionary::Dictionary(std::vector<std::string> words)
      : words_(std::move(words)) {
    entropy_map_.reserve(words_.size());
    for (size_t i = 0; i < words_.size(); ++i) {
      entropy_map_.emplace(words_[i], EntropyToken(i));
    }
  }

  outcome::result<std::shared_ptr<const Dictionary>> Dictionary::create(
      std::vector<std::string> words) {
    if (words.size() != kDictionaryWords) {
      return DictionaryError::WRONG_WORDS_COUNT;
    }
    if (std::ranges::any_of(words, [](const auto &w) { return w.empty(); })) {
      return DictionaryError::EMPTY_WORD;
    }

    // constructor is private, so std::make_shared can't reach it
    std::shared_ptr<const Dictionary> dictionary(
        new Dictionary(std::move(words)));

    // repeated word is inserted into the map only once
    if (dictionary->entropy_map_.size() != kDictionaryWords) {
      return DictionaryError::DUPLICATE_WORD;
    }
    return dictionary;
  }

  std::shared_ptr<const Dictionary> Dictionary::english() {
    static const std::shared_ptr<const Dictionary> instance = [] {
      auto res = create(std::vector<std::string>(english::dictionary.begin(),
                                                 english::dictionary.end()));
      BOOST_ASSERT_MSG(res.has_value(), "english wordlist is malformed");
      return std::move(res.value());
    }();
    return instance;
  }

  outcome::result<EntropyToken> Dictionary::findValue(
      std::string_view word) const {
    auto loc = entropy_map_.find(word);
    if (entropy_map_.end() != loc) {
      return loc->second;
    }

    return Bip39Error::UNKNOWN_WORD;
  }

  std::string_view Dictionary::findWord(const EntropyToken &token) const {
    return words_[token.to_ulong()];
  }

  bool Dictionary::contains(std::string_view word) const {
    return entropy_map_.contains(word);
  }

}  // namespace seedphrase::crypto::bip39

OUTCOME_CPP_DEFINE_CATEGORY(seedphrase::crypto::bip39, DictionaryError, e) {
  using E = seedphrase::crypto::bip39::DictionaryError;
  switch (e) {
    case E::WRONG_WORDS_COUNT:
      return "dictionary must contain exactly 2048 words";
    case E::DUPLICATE_WORD:
      return "dictionary contains repeated word";
    case E::EMPTY_WORD:
      return "dictionary contains empty word";
  }
  return "unknown DictionaryError error";
}
