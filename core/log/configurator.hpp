/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace seedphrase::log {

  /**
   * @class Configurator of the logging system. Without explicit config uses
   * the embedded one, which declares group tree `main` -> `seedphrase` ->
   * `crypto` -> `bip39`
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    Configurator(std::shared_ptr<PrevConfigurator> previous);

    /// @param config YAML content
    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::string config);

    /// @param path file with YAML content
    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::filesystem::path path);
  };

}  // namespace seedphrase::log
