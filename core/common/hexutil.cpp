/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <iterator>

#include <boost/algorithm/hex.hpp>

#include "common/buffer_view.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(seedphrase::common, UnhexError, e) {
  using seedphrase::common::UnhexError;
  switch (e) {
    case UnhexError::NON_HEX_INPUT:
      return "Input contains non-hex characters";
    case UnhexError::NOT_ENOUGH_INPUT:
      return "Input contains odd number of characters";
  }
  return "Unknown UnhexError";
}

namespace seedphrase::common {
  std::string hex_lower(BufferView bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(
          hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::NOT_ENOUGH_INPUT;
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::NON_HEX_INPUT;
    }
    return bytes;
  }
}  // namespace seedphrase::common
