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

#include <fmt/format.h>

namespace parley {
namespace voice {

/// @brief Components of an http(s) or ws(s) url
struct Url {
  string scheme;
  string host;
  string port;
  string target{"/"};

  /// @brief Split a url into its components.  Port defaults to 443 for
  ///        https and wss, 80 for http and ws.
  /// @param text url
  /// @param url populated url
  /// @return boolean, false for unknown schemes or a missing host
  static bool parse(csv text, Url &url) noexcept;

  bool secure() const noexcept { return (scheme == "https") || (scheme == "wss"); }

  /// @brief Host header value, port omitted when it is the default
  string host_header() const noexcept;
};

} // namespace voice
} // namespace parley

template <> struct fmt::formatter<parley::voice::Url> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const parley::voice::Url &u, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}://{}:{}{}", u.scheme, u.host, u.port, u.target);
  }
};
