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

#include "media/inbound.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "base/stats.hpp"
#include "rtp/header.hpp"

namespace parley {
namespace media {

error_code Inbound::drop(error_code ec, uint8_t pt) noexcept {
  const auto n = ++packets_dropped;

  // log the first drop then every 100th
  if ((n == 1) || ((n % 100) == 0)) INFO("drop", "pt={} dropped={} {}", pt, n, ec);

  Stats::write(stats::RTP_IN_DROPPED, 1);

  return ec;
}

error_code Inbound::handle(std::span<const uint8_t> packet) noexcept {
  if (rtp::Header::is_rtcp(packet)) return error_code();

  packets_in++;
  Stats::write(stats::RTP_IN_PACKETS, 1);

  rtp::Header hdr;
  std::span<const uint8_t> payload;

  if (auto ec = rtp::Header::parse(packet, hdr, payload); ec) return drop(ec, 0xff);

  std::scoped_lock lck(mtx);

  const auto c = pt_map.lookup(hdr.payload_type);

  if (auto ec = transcoder.decode(c, payload, pcm); ec) return drop(ec, hdr.payload_type);

  auto session = registry.active();
  if (!session) return error_code(); // no active session, silently dropped

  if (session->inbound() != c) session->inbound(c);

  if (session->forward(pcm.span())) packets_forwarded++;

  return error_code();
}

} // namespace media
} // namespace parley
