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
#include "base/uint8v.hpp"
#include "codec/ids.hpp"
#include "rtp/sink.hpp"

#include <memory>
#include <mutex>
#include <span>

namespace parley {
namespace rtp {

/// @brief Frames PCM from the voice session into outbound packets.
///        Each PCM message becomes exactly one packet; counters start
///        at zero (unless given) and belong to a single session.  Both
///        counters wrap modulo their width.
class Packetizer {
public:
  /// @brief Construct the packetizer
  /// @param codec fixed outbound waveform codec (PCMU or PCMA)
  /// @param ssrc fixed synchronization source
  /// @param sink outbound transport
  /// @param first_seq sequence number of the first packet
  /// @param first_ts timestamp of the first packet
  Packetizer(codec::Codec codec, ssrc_t ssrc, std::shared_ptr<Sink> sink,
             seq_num_t first_seq = 0, rtp_ts_t first_ts = 0) noexcept
      : codec(codec), ssrc(ssrc), sink(std::move(sink)), seq_num(first_seq), ts(first_ts) {}

  /// @brief Encode, frame and write one PCM message.  Empty PCM (or a
  ///        single odd byte) produces no packet.
  /// @param pcm little endian 16-bit samples
  /// @return error_code, send_failure when the sink rejects the write
  error_code send(std::span<const uint8_t> pcm) noexcept;

  /// @brief Build the next packet, advancing the counters
  /// @param pcm little endian 16-bit samples
  /// @return marshaled packet, empty when pcm holds no whole sample
  uint8v next_packet(std::span<const uint8_t> pcm) noexcept;

  seq_num_t sequence() const noexcept {
    std::scoped_lock lck(mtx);
    return seq_num;
  }

  rtp_ts_t timestamp() const noexcept {
    std::scoped_lock lck(mtx);
    return ts;
  }

  codec::Codec outbound_codec() const noexcept { return codec; }

private:
  uint8v build(std::span<const uint8_t> pcm) noexcept;

private:
  // order dependent
  const codec::Codec codec;
  const ssrc_t ssrc;
  std::shared_ptr<Sink> sink;
  seq_num_t seq_num;
  rtp_ts_t ts;

  // order independent
  mutable std::mutex mtx;

public:
  MOD_ID("rtp.packetizer");
};

} // namespace rtp
} // namespace parley
