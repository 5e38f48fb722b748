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

#include "base/asio.hpp"
#include "base/types.hpp"

#include <fmt/format.h>
#include <variant>

namespace parley {
namespace voice {

/// @brief Control message received as a text frame from the voice session
struct ControlEvent {
  struct Transcript {
    string role;
    bool final{false};
    string text;
    string delta;
  };

  struct Error {
    string error;
  };

  struct State {
    string state;
  };

  struct Unknown {
    string raw;
  };

  using event_v = std::variant<Transcript, Error, State, Unknown>;

  string kind; // value of the "type" field
  event_v event;

  /// @brief Parse a text frame
  /// @param text frame payload
  /// @param ev populated event
  /// @return error_code, malformed_control for invalid json, a missing
  ///         type or a type that is not a string
  static error_code parse(csv text, ControlEvent &ev) noexcept;

  template <typename T> bool is() const noexcept { return std::holds_alternative<T>(event); }
  template <typename T> const T &as() const noexcept { return std::get<T>(event); }
};

} // namespace voice
} // namespace parley
