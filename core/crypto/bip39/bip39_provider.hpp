/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/buffer.hpp"
#include "crypto/bip39/bip39_types.hpp"
#include "crypto/bip39/mnemonic_codec.hpp"

namespace seedphrase::crypto {

  /**
   * @class Bip39Provider generates entropy for new mnemonics and creates seed
   * from mnemonic
   */
  class Bip39Provider {
   public:
    virtual ~Bip39Provider() = default;

    /**
     * @brief generates random entropy
     * @param bits_count 128, 160, 192, 224 or 256
     * @return bits_count / 8 random bytes
     */
    virtual outcome::result<common::Buffer> generateEntropy(
        size_t bits_count) = 0;

    /**
     * @brief generates random entropy and encodes it as mnemonic
     * @param codec codec of the wanted language
     * @param bits_count 128, 160, 192, 224 or 256
     * @return mnemonic phrase
     */
    virtual outcome::result<std::string> generateMnemonic(
        const bip39::MnemonicCodec &codec, size_t bits_count) = 0;

    /**
     * @brief makes seed from mnemonic phrase without validating it
     * @param mnemonic phrase used as password as is
     * @param password optional passphrase, salt is "mnemonic" + password
     * @return seed bytes
     */
    virtual outcome::result<bip39::Bip39Seed> makeSeed(
        std::string_view mnemonic, std::string_view password) = 0;

    /**
     * @brief validates mnemonic and makes seed from it
     * @param codec codec of the mnemonic language
     * @param mnemonic phrase, words separated by whitespace
     * @param password optional passphrase
     * @return seed bytes or error of MnemonicCodec::unmarshalEntropy()
     */
    virtual outcome::result<bip39::Bip39Seed> deriveSeed(
        const bip39::MnemonicCodec &codec,
        std::string_view mnemonic,
        std::string_view password) = 0;
  };

}  // namespace seedphrase::crypto
