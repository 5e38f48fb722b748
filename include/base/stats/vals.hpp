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

#include <cstdint>

namespace parley {
namespace stats {

enum stats_v : uint8_t {
  CONTROL_DROPPED = 0,
  CONTROL_MSGS,
  NEGOTIATE_ELAPSED,
  PCM_FORWARDED,
  RTP_IN_DROPPED,
  RTP_IN_PACKETS,
  RTP_OUT_PACKETS,
  SESSION_CREATED
  // comment allows for easy IDE sorting
};

} // namespace stats
} // namespace parley
