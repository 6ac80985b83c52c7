/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "common/hexutil.hpp"

namespace seedphrase::common {

  /**
   * @brief Non-owning view of a contiguous byte sequence
   */
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    /// bytes of a string, without terminating zero
    static BufferView fromString(std::string_view str) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    bool operator==(const BufferView &other) const {
      return std::ranges::equal(*this, other);
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }
}  // namespace seedphrase::common

namespace seedphrase {
  using common::BufferView;
}  // namespace seedphrase
