/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/mnemonic.hpp"

#include <cstdint>

#include "crypto/bip39/bip39_types.hpp"

namespace seedphrase::crypto::bip39 {

  namespace {
    struct CodePoint {
      uint32_t value;
      size_t size;
    };

    /**
     * Decodes UTF-8 sequence starting at {@param pos}. Malformed byte is
     * returned as a single non-space unit, so it stays a part of a word
     */
    CodePoint decodeAt(std::string_view s, size_t pos) {
      const auto c = static_cast<uint8_t>(s[pos]);
      const auto cont = [&](size_t i) {
        return pos + i < s.size()
           and (static_cast<uint8_t>(s[pos + i]) & 0xC0) == 0x80;
      };
      const auto bits = [&](size_t i) -> uint32_t {
        return static_cast<uint8_t>(s[pos + i]) & 0x3F;
      };

      if (c <= 0x7F) {
        return {c, 1};
      }
      if ((c & 0xE0) == 0xC0 and cont(1)) {
        return {((c & 0x1Fu) << 6) | bits(1), 2};
      }
      if ((c & 0xF0) == 0xE0 and cont(1) and cont(2)) {
        return {((c & 0x0Fu) << 12) | (bits(1) << 6) | bits(2), 3};
      }
      if ((c & 0xF8) == 0xF0 and cont(1) and cont(2) and cont(3)) {
        return {((c & 0x07u) << 18) | (bits(1) << 12) | (bits(2) << 6)
                    | bits(3),
                4};
      }
      return {0xFFFD, 1};
    }

    /// White_Space code points, ASCII control ones, NEL, NBSP and Zs/Zl/Zp
    bool isSpace(uint32_t cp) {
      switch (cp) {
        case '\t':
        case '\n':
        case '\v':
        case '\f':
        case '\r':
        case ' ':
        case 0x0085:
        case 0x00A0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
          return true;
        default:
          return cp >= 0x2000 and cp <= 0x200A;
      }
    }
  }  // namespace

  outcome::result<Mnemonic> Mnemonic::parse(std::string_view phrase) {
    Mnemonic mnemonic;

    size_t word_begin = 0;
    bool in_word = false;
    for (size_t pos = 0; pos < phrase.size();) {
      const auto cp = decodeAt(phrase, pos);
      if (isSpace(cp.value)) {
        if (in_word) {
          mnemonic.words.emplace_back(
              phrase.substr(word_begin, pos - word_begin));
          in_word = false;
        }
      } else if (not in_word) {
        word_begin = pos;
        in_word = true;
      }
      pos += cp.size;
    }
    if (in_word) {
      mnemonic.words.emplace_back(phrase.substr(word_begin));
    }

    OUTCOME_TRY(validateWordsCount(mnemonic.words.size()));
    return mnemonic;
  }
}  // namespace seedphrase::crypto::bip39
