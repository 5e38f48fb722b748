//  Parley - Browser audio bridge for voice AI sessions
//  Copyright (C) 2022  Tim Hughey
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//  https://www.wisslanding.com

#pragma once

#include "base/types.hpp"

#include <algorithm>
#include <cctype>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <vector>

namespace parley {

/// @brief Multi-purpose byte container
class uint8v : public std::vector<uint8_t> {

public:
  /// @brief Construct an empty container
  uint8v() = default;

  /// @brief Constructor container with count bytes allocated
  /// @param count byte to allocate
  /// @param byte fill with value (default 0x00)
  explicit uint8v(size_t count, uint8_t byte = 0x00) noexcept
      : std::vector<uint8_t>(count, byte) {}

  /// @brief Construct container from an initializer list of bytes
  uint8v(std::initializer_list<uint8_t> il) : std::vector<uint8_t>(il) {}

  /// @brief Construct container as a copy of the span
  /// @param span bytes to copy
  explicit uint8v(std::span<const uint8_t> span) noexcept
      : std::vector<uint8_t>(span.begin(), span.end()) {}

  /// @brief Construct container as a copy of the (text) string view
  /// @param sv text to copy
  explicit uint8v(csv sv) noexcept : std::vector<uint8_t>(sv.begin(), sv.end()) {}

  /// @brief Append a value in network (big endian) byte order
  /// @tparam T unsigned integral type
  /// @param val value to append
  template <typename T>
    requires std::unsigned_integral<T>
  void append_be(T val) noexcept {
    for (int shift = (sizeof(T) - 1) * 8; shift >= 0; shift -= 8) {
      push_back(static_cast<uint8_t>(val >> shift));
    }
  }

  /// @brief Append the bytes of a span
  /// @param span bytes to append
  void append(std::span<const uint8_t> span) noexcept { insert(end(), span.begin(), span.end()); }

  /// @brief Pointer to raw container data
  /// @tparam T Pointer type
  /// @param offset Offset applied to pointer, default 0
  /// @return Raw pointer of type T with offset applied
  template <typename T = char> T *data_as(std::ptrdiff_t offset = 0) noexcept {
    return (T *)(data() + offset);
  }

  /// @brief Return const raw pointer to container data with offset applied
  /// @tparam T Treat as data type
  /// @param offset bytes to offset, default 0
  /// @return Raw const pointer to container data with offset applied
  template <typename T = char> const T *raw(size_t offset = 0) const noexcept {
    return (const T *)(data() + offset);
  }

  /// @brief Convert n bytes at offset (big endian) to an uint32_t
  /// @param offset offset into container
  /// @param n number of bytes to use in conversion
  /// @return converted uint32_t
  uint32_t to_uint32(size_t offset, int n) const noexcept {
    uint32_t val = 0;

    for (auto it = std::counted_iterator{begin() + offset, n}; it != std::default_sentinel; ++it) {
      val = (val << 8) | *it;
    }

    return val;
  }

  /// @brief Span of the container contents
  /// @param offset starting offset, default to 0
  /// @return span of const bytes
  std::span<const uint8_t> span(size_t offset = 0) const noexcept {
    return std::span<const uint8_t>(data() + offset, size() - offset);
  }

  /// @brief Return const string view starting at offset for bytes
  /// @param offset starting offset, default to 0
  /// @param bytes count of bytes to include, default to 0 (remainder)
  /// @return const string view
  csv view(const size_t offset = 0, size_t bytes = 0) const noexcept {
    bytes = (bytes == 0) ? size() - offset : bytes;
    return string_view(raw<char>(offset), bytes);
  }

  /// @brief Is container printable (first 10% examined)
  /// @return boolean
  bool printable() const noexcept {
    if (size()) {
      return std::all_of(begin(), begin() + std::max<size_t>(1, size() / 10), [](auto c) {
        return std::isprint(static_cast<unsigned char>(c));
      });
    }

    return false;
  }

public:
  static constexpr auto module_id_base{"uint8v"sv};
};

} // namespace parley
