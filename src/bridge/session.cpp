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

#include "bridge/session.hpp"
#include "base/logger.hpp"
#include "base/stats.hpp"

namespace parley {
namespace bridge {

bool Session::forward(std::span<const uint8_t> pcm) noexcept {
  std::shared_ptr<voice::Channel> ch;

  {
    std::scoped_lock lck(mtx);
    ch = channel;
  }

  if (!ch || pcm.empty()) return false;

  if (auto ec = ch->write_binary(pcm); ec) {
    INFO("forward", "{} bytes={} {}", uuid, pcm.size(), ec);
    return false;
  }

  Stats::write(stats::PCM_FORWARDED, 1);

  return true;
}

} // namespace bridge
} // namespace parley
