/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(seedphrase::common, BlobError, e) {
  using seedphrase::common::BlobError;

  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input has incorrect length, not matching the blob size";
  }

  return "Unknown error";
}

namespace seedphrase::common {

  // explicit instantiations for the most frequently used blobs
  template class Blob<32ul>;
  template class Blob<64ul>;

}  // namespace seedphrase::common
