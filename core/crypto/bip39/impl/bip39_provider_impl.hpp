/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/bip39/bip39_provider.hpp"

#include <memory>

#include "crypto/pbkdf2/pbkdf2_provider.hpp"
#include "crypto/random_generator.hpp"
#include "log/logger.hpp"

namespace seedphrase::crypto {

  class Bip39ProviderImpl : public Bip39Provider {
   public:
    ~Bip39ProviderImpl() override = default;

    Bip39ProviderImpl(std::shared_ptr<Pbkdf2Provider> pbkdf2_provider,
                      std::shared_ptr<CSPRNG> random_generator);

    outcome::result<common::Buffer> generateEntropy(
        size_t bits_count) override;

    outcome::result<std::string> generateMnemonic(
        const bip39::MnemonicCodec &codec, size_t bits_count) override;

    outcome::result<bip39::Bip39Seed> makeSeed(
        std::string_view mnemonic, std::string_view password) override;

    outcome::result<bip39::Bip39Seed> deriveSeed(
        const bip39::MnemonicCodec &codec,
        std::string_view mnemonic,
        std::string_view password) override;

   private:
    std::shared_ptr<Pbkdf2Provider> pbkdf2_provider_;
    std::shared_ptr<CSPRNG> random_generator_;
    log::Logger logger_;
  };

}  // namespace seedphrase::crypto
