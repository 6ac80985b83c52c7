/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace seedphrase::common {

  class BufferView;

  /**
   * @brief reasons of malformed hex input
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
  };

  /// @return lowercase hex of bytes, without prefix
  std::string hex_lower(BufferView bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex string of even length, both cases are accepted
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

}  // namespace seedphrase::common

OUTCOME_HPP_DECLARE_ERROR(seedphrase::common, UnhexError);
