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

namespace parley {
namespace bridge {

/// @brief A connection that receives verbatim copies of control messages
class Observer {
public:
  virtual ~Observer() = default;

  /// @brief Send a text message to the observer
  /// @param text control message exactly as received from the voice session
  /// @return error_code, send_failure when the write fails
  virtual error_code mirror(csv text) noexcept = 0;
};

} // namespace bridge
} // namespace parley
