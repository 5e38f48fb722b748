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

#include <compare>
#include <fmt/format.h>
#include <uuid/uuid.h>

namespace parley {

/// @brief Random (v4) uuid in lower case text form
struct UUID {
  friend struct fmt::formatter<UUID>;

  /// @brief Construct a UUID
  UUID() noexcept : storage(37, 0x00) {
    uuid_t binuuid;
    uuid_generate_random(binuuid);
    uuid_unparse_lower(binuuid, storage.data());

    storage.resize(36); // drop the trailing null written by uuid_unparse
  }

  /// @brief Return object as string
  /// @return string
  const string &operator()() const noexcept { return storage; }

  auto operator<=>(const UUID &rhs) const = default;

  operator string() const noexcept { return storage; }

private:
  std::string storage;
};

} // namespace parley

template <> struct fmt::formatter<parley::UUID> {

  // Presentation format: 'f' - full, 's' - short (default)
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();

    if ((it != end) && ((*it == 'f') || (*it == 's'))) presentation = *it++;

    if ((it != end) && (*it != '}')) throw format_error("invalid format");

    return it;
  }

  template <typename FormatContext>
  auto format(const parley::UUID &uuid, FormatContext &ctx) const -> decltype(ctx.out()) {
    const auto &s = uuid.storage;

    if (presentation == 'f') return fmt::format_to(ctx.out(), "{}", s);

    return fmt::format_to(ctx.out(), "{}", std::string_view(s).substr(s.find_last_of('-') + 1));
  }
};
