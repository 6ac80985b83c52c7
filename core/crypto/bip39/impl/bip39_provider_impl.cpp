/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/impl/bip39_provider_impl.hpp"

#include <exception>
#include <span>

#include <boost/assert.hpp>

#include "crypto/bip39/const.hpp"

namespace seedphrase::crypto {

  Bip39ProviderImpl::Bip39ProviderImpl(
      std::shared_ptr<Pbkdf2Provider> pbkdf2_provider,
      std::shared_ptr<CSPRNG> random_generator)
      : pbkdf2_provider_(std::move(pbkdf2_provider)),
        random_generator_(std::move(random_generator)),
        logger_{log::createLogger("Bip39Provider", "bip39")} {
    BOOST_ASSERT(pbkdf2_provider_ != nullptr);
    BOOST_ASSERT(random_generator_ != nullptr);
  }

  outcome::result<common::Buffer> Bip39ProviderImpl::generateEntropy(
      size_t bits_count) {
    OUTCOME_TRY(bip39::validateEntropyBitSize(bits_count));

    common::Buffer entropy(bits_count / 8, 0);
    try {
      random_generator_->fillRandomly(
          std::span<uint8_t>(entropy.data(), entropy.size()));
    } catch (const std::exception &) {
      return bip39::Bip39Error::RANDOM_SOURCE_FAILURE;
    }

    SL_DEBUG(logger_, "Generated {} bits of entropy", bits_count);
    return entropy;
  }

  outcome::result<std::string> Bip39ProviderImpl::generateMnemonic(
      const bip39::MnemonicCodec &codec, size_t bits_count) {
    OUTCOME_TRY(entropy, generateEntropy(bits_count));
    return codec.marshalEntropy(entropy);
  }

  outcome::result<bip39::Bip39Seed> Bip39ProviderImpl::makeSeed(
      std::string_view mnemonic, std::string_view password) {
    common::Buffer salt{};
    salt.put(bip39::kSeedSaltPrefix);
    salt.put(password);

    OUTCOME_TRY(key,
                pbkdf2_provider_->deriveKey(
                    common::BufferView::fromString(mnemonic),
                    salt,
                    bip39::kSeedIterations,
                    bip39::constants::BIP39_SEED_LEN_512));
    return bip39::Bip39Seed::fromSpan(key);
  }

  outcome::result<bip39::Bip39Seed> Bip39ProviderImpl::deriveSeed(
      const bip39::MnemonicCodec &codec,
      std::string_view mnemonic,
      std::string_view password) {
    OUTCOME_TRY(checksummed, codec.unmarshalEntropy(mnemonic));
    OUTCOME_TRY(seed, makeSeed(mnemonic, password));

    SL_TRACE(logger_,
             "Seed derived from mnemonic of {} entropy bytes",
             checksummed.size() - 1);
    return seed;
  }
}  // namespace seedphrase::crypto
