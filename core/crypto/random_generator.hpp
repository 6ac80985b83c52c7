/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/crypto/random_generator.hpp>

namespace seedphrase::crypto {
  /// source of entropy for mnemonic generation
  using CSPRNG = libp2p::crypto::random::CSPRNG;
}  // namespace seedphrase::crypto
