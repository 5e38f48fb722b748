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

#include "base/stats/vals.hpp"
#include "base/types.hpp"

#include <map>

namespace parley {
namespace stats {

/// @brief Creates the stats val to human readable timeseries db metric
///        this free function is only called by Stats
/// @return map of val to text
inline std::map<stats::stats_v, string> make_map() noexcept {

  return std::map<stats::stats_v, string>{
      // create map of stats val to text
      {stats::CONTROL_DROPPED, "control_dropped"},
      {stats::CONTROL_MSGS, "control_msgs"},
      {stats::NEGOTIATE_ELAPSED, "negotiate_elapsed"},
      {stats::PCM_FORWARDED, "pcm_forwarded"},
      {stats::RTP_IN_DROPPED, "rtp_in_dropped"},
      {stats::RTP_IN_PACKETS, "rtp_in_packets"},
      {stats::RTP_OUT_PACKETS, "rtp_out_packets"},
      {stats::SESSION_CREATED, "session_created"},
      // comment allows for easy IDE sorting
  };
}

} // namespace stats
} // namespace parley
