/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace seedphrase::crypto::bip39 {

  struct Mnemonic {
    using Words = std::vector<std::string>;

    Words words;

    /**
     * @brief parse mnemonic from UTF-8 phrase, words are separated by runs of
     * Unicode whitespace (ASCII spaces, NBSP, ideographic space U+3000 etc.)
     * @param phrase list of words from bip-39 word list
     * @return Mnemonic instance or Bip39Error::INVALID_MNEMONIC_LENGTH if
     * number of words is not supported. Words are not looked up here
     */
    static outcome::result<Mnemonic> parse(std::string_view phrase);
  };
}  // namespace seedphrase::crypto::bip39
