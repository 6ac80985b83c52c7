/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/random_generator.hpp"

#include <libp2p/crypto/random_generator/boost_generator.hpp>

namespace seedphrase::crypto {

  /// CSPRNG over boost::random_device, reads the OS entropy source
  using BoostRandomGenerator = libp2p::crypto::random::BoostRandomGenerator;

}  // namespace seedphrase::crypto
