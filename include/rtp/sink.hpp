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
#include "base/uint8v.hpp"

namespace parley {
namespace rtp {

/// @brief Destination for marshaled outbound packets (the browser
///        transport's audio track)
class Sink {
public:
  virtual ~Sink() = default;

  /// @brief Write one complete packet
  /// @param packet header and payload
  /// @return error_code, send_failure when the transport rejects the write
  virtual error_code write(const uint8v &packet) noexcept = 0;
};

} // namespace rtp
} // namespace parley
