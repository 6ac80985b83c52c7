/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <iostream>

#include <libp2p/log/configurator.hpp>

#include "crypto/bip39/impl/bip39_provider_impl.hpp"
#include "crypto/pbkdf2/impl/pbkdf2_provider_impl.hpp"
#include "crypto/random_generator/boost_generator.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

using seedphrase::crypto::Bip39ProviderImpl;
using seedphrase::crypto::BoostRandomGenerator;
using seedphrase::crypto::Pbkdf2ProviderImpl;
using seedphrase::crypto::bip39::MnemonicCodec;

namespace {
  int run() {
    auto logger = seedphrase::log::createLogger(
        "Main", seedphrase::log::defaultGroupName);

    Bip39ProviderImpl provider(std::make_shared<Pbkdf2ProviderImpl>(),
                               std::make_shared<BoostRandomGenerator>());
    const auto codec = MnemonicCodec::english();

    auto entropy_res = provider.generateEntropy(256);
    if (not entropy_res) {
      SL_ERROR(logger,
               "Can't generate entropy: {}",
               entropy_res.error().message());
      return EXIT_FAILURE;
    }
    const auto &entropy = entropy_res.value();
    std::cout << "entropy:     " << entropy.toHex() << '\n';

    auto mnemonic_res = codec.marshalEntropy(entropy);
    if (not mnemonic_res) {
      SL_ERROR(
          logger, "Can't encode entropy: {}", mnemonic_res.error().message());
      return EXIT_FAILURE;
    }
    const auto &mnemonic = mnemonic_res.value();
    std::cout << "mnemonic:    " << mnemonic << '\n';

    auto checksummed_res = codec.unmarshalEntropy(mnemonic);
    if (not checksummed_res) {
      SL_ERROR(logger,
               "Can't decode mnemonic: {}",
               checksummed_res.error().message());
      return EXIT_FAILURE;
    }
    std::cout << "checksummed: " << checksummed_res.value().toHex() << '\n';

    auto seed_res = provider.deriveSeed(codec, mnemonic, "TREZOR");
    if (not seed_res) {
      SL_ERROR(logger, "Can't derive seed: {}", seed_res.error().message());
      return EXIT_FAILURE;
    }
    std::cout << "seed:        " << seed_res.value().toHex() << '\n';

    return EXIT_SUCCESS;
  }
}  // namespace

int main() {
  auto logging_system = std::make_shared<soralog::LoggingSystem>(
      std::make_shared<seedphrase::log::Configurator>(
          std::make_shared<libp2p::log::Configurator>()));

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  seedphrase::log::setLoggingSystem(logging_system);

  return run();
}
