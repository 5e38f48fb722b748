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

#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <compare>
#include <fmt/format.h>

namespace parley {
namespace voice {

/// @brief Duration exchanged with the voice service.  Serialized as
///        seconds with an "s" suffix ("60s", "0.4s").
class Duration {
public:
  constexpr Duration() = default;

  template <typename D>
    requires IsDuration<D>
  constexpr Duration(D d) noexcept : nanos(std::chrono::duration_cast<Nanos>(d)) {}

  static Duration from_seconds(double secs) noexcept {
    return Duration(std::chrono::duration_cast<Nanos>(seconds_fp(secs)));
  }

  /// @brief Parse a duration string composed of h, m, s, ms, us and ns
  ///        units ("1m30s", "0.4s") or a plain number of seconds ("30")
  /// @param text source text
  /// @param d populated duration
  /// @return boolean indicating success
  static bool parse(csv text, Duration &d) noexcept;

  /// @brief Seconds with an "s" suffix, whole seconds without decimals
  /// @return string
  string to_string() const noexcept;

  Nanos get() const noexcept { return nanos; }
  double seconds() const noexcept { return seconds_fp(nanos).count(); }
  bool zero() const noexcept { return nanos == Nanos::zero(); }

  auto operator<=>(const Duration &) const = default;

private:
  Nanos nanos{0};
};

} // namespace voice
} // namespace parley

template <> struct fmt::formatter<parley::voice::Duration> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const parley::voice::Duration &d, FormatContext &ctx) const -> decltype(ctx.out()) {
    return formatter<std::string>::format(d.to_string(), ctx);
  }
};
