/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/outcome/outcome.hpp>

// OUTCOME_TRY, OUTCOME_HPP_DECLARE_ERROR and OUTCOME_CPP_DEFINE_CATEGORY come
// together with libp2p's outcome
namespace outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;
}  // namespace outcome
