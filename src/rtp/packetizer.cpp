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

#include "rtp/packetizer.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "base/stats.hpp"
#include "codec/g711.hpp"
#include "rtp/header.hpp"

namespace parley {
namespace rtp {

// caller holds mtx
uint8v Packetizer::build(std::span<const uint8_t> pcm) noexcept {
  auto payload = codec::g711::encode(codec, pcm);

  if (payload.empty()) return uint8v();

  Header hdr;
  hdr.payload_type = codec::static_pt(codec);
  hdr.seq_num = seq_num++;
  hdr.timestamp = ts;
  hdr.ssrc = ssrc;

  // clock rate equals sample rate, one companded byte per sample
  ts += static_cast<rtp_ts_t>(payload.size());

  uint8v packet;
  packet.reserve(Header::size() + payload.size());

  hdr.marshal(packet);
  packet.append(payload.span());

  return packet;
}

uint8v Packetizer::next_packet(std::span<const uint8_t> pcm) noexcept {
  std::scoped_lock lck(mtx);

  return build(pcm);
}

error_code Packetizer::send(std::span<const uint8_t> pcm) noexcept {
  // build and write under one lock so concurrent producers never interleave
  std::scoped_lock lck(mtx);

  const auto packet = build(pcm);
  if (packet.empty()) return error_code();

  if (!sink) return make_error_code(err::send_failure);

  auto ec = sink->write(packet);

  if (ec) {
    INFO("send", "write failed seq={} {}", static_cast<seq_num_t>(seq_num - 1), ec);
  } else {
    Stats::write(stats::RTP_OUT_PACKETS, 1);
  }

  return ec;
}

} // namespace rtp
} // namespace parley
