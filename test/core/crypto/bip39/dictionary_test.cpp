/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/dictionary.hpp"

#include <type_traits>

#include <gtest/gtest.h>

#include "crypto/bip39/wordlist/english.hpp"
#include "testutil/outcome.hpp"

using namespace seedphrase::crypto::bip39;

namespace {
  std::vector<std::string> englishWords() {
    return std::vector<std::string>(english::dictionary.begin(),
                                    english::dictionary.end());
  }
}  // namespace

/**
 * @given english dictionary
 * @when words are looked up
 * @then their positions in the wordlist are returned
 */
TEST(DictionaryTest, EnglishLookup) {
  auto dictionary = Dictionary::english();

  EXPECT_OUTCOME_TRUE(abandon, dictionary->findValue("abandon"));
  EXPECT_EQ(abandon.to_ulong(), 0);
  EXPECT_OUTCOME_TRUE(about, dictionary->findValue("about"));
  EXPECT_EQ(about.to_ulong(), 3);
  EXPECT_OUTCOME_TRUE(legal, dictionary->findValue("legal"));
  EXPECT_EQ(legal.to_ulong(), 1019);
  EXPECT_OUTCOME_TRUE(zoo, dictionary->findValue("zoo"));
  EXPECT_EQ(zoo.to_ulong(), 2047);

  EXPECT_EQ(dictionary->findWord(EntropyToken(2015)), "winner");
  EXPECT_EQ(dictionary->findWord(EntropyToken(102)), "art");
}

/**
 * @given english dictionary
 * @when every index is mapped to a word and back
 * @then the same index is returned
 */
TEST(DictionaryTest, EnglishIsBijective) {
  auto dictionary = Dictionary::english();
  for (size_t i = 0; i < kDictionaryWords; ++i) {
    EntropyToken token(i);
    auto word = dictionary->findWord(token);
    EXPECT_OUTCOME_TRUE(found, dictionary->findValue(word));
    EXPECT_EQ(found, token) << word;
  }
}

/**
 * @given english dictionary
 * @when words absent from it are looked up
 * @then UNKNOWN_WORD is returned
 */
TEST(DictionaryTest, UnknownWord) {
  auto dictionary = Dictionary::english();
  EXPECT_EC(dictionary->findValue("bitcoin"), Bip39Error::UNKNOWN_WORD);
  EXPECT_EC(dictionary->findValue("Abandon"), Bip39Error::UNKNOWN_WORD);
  EXPECT_EC(dictionary->findValue(""), Bip39Error::UNKNOWN_WORD);
  EXPECT_FALSE(dictionary->contains("bitcoin"));
  EXPECT_TRUE(dictionary->contains("zoo"));
}

/**
 * @given english dictionary requested twice
 * @then the same instance is returned
 */
TEST(DictionaryTest, EnglishIsShared) {
  EXPECT_EQ(Dictionary::english(), Dictionary::english());
}

/**
 * @given custom wordlist of 2048 distinct words
 * @when dictionary is created
 * @then words are indexed by position
 */
TEST(DictionaryTest, CustomWordlist) {
  std::vector<std::string> words;
  for (size_t i = 0; i < kDictionaryWords; ++i) {
    words.push_back("w" + std::to_string(i));
  }
  EXPECT_OUTCOME_TRUE(dictionary, Dictionary::create(std::move(words)));
  EXPECT_OUTCOME_TRUE(token, dictionary->findValue("w1234"));
  EXPECT_EQ(token.to_ulong(), 1234);
  EXPECT_EQ(dictionary->findWord(EntropyToken(7)), "w7");
}

/**
 * @given dictionary type
 * @then it can be obtained only through create(), already shared
 */
TEST(DictionaryTest, ConstructedOnlyByCreate) {
  static_assert(
      not std::is_constructible_v<Dictionary, std::vector<std::string>>);
  static_assert(not std::is_copy_constructible_v<Dictionary>);
  EXPECT_OUTCOME_TRUE(dictionary, Dictionary::create(englishWords()));
  EXPECT_EQ(dictionary.use_count(), 1);
  EXPECT_NE(dictionary, Dictionary::english());
}

/**
 * @given wordlists of wrong size
 * @when dictionary is created
 * @then WRONG_WORDS_COUNT is returned
 */
TEST(DictionaryTest, WrongWordsCount) {
  auto words = englishWords();
  words.pop_back();
  EXPECT_EC(Dictionary::create(words), DictionaryError::WRONG_WORDS_COUNT);

  words.emplace_back("zoo");
  words.emplace_back("zoom");
  EXPECT_EC(Dictionary::create(words), DictionaryError::WRONG_WORDS_COUNT);

  EXPECT_EC(Dictionary::create({}), DictionaryError::WRONG_WORDS_COUNT);
}

/**
 * @given wordlist with a repeated word
 * @when dictionary is created
 * @then DUPLICATE_WORD is returned
 */
TEST(DictionaryTest, DuplicateWord) {
  auto words = englishWords();
  words[100] = words[200];
  EXPECT_EC(Dictionary::create(std::move(words)),
            DictionaryError::DUPLICATE_WORD);
}

/**
 * @given wordlist with an empty word
 * @when dictionary is created
 * @then EMPTY_WORD is returned
 */
TEST(DictionaryTest, EmptyWord) {
  auto words = englishWords();
  words[5].clear();
  EXPECT_EC(Dictionary::create(std::move(words)), DictionaryError::EMPTY_WORD);
}
