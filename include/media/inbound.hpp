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
#include "bridge/registry.hpp"
#include "codec/ids.hpp"
#include "codec/transcoder.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>

namespace parley {
namespace media {

/// @brief Per-stream inbound handler: each packet received from the
///        browser is parsed, mapped to its negotiated codec, decoded to
///        PCM and forwarded to the active session's voice channel
class Inbound {
public:
  Inbound(bridge::Registry &registry, int sample_rate) noexcept
      : registry(registry), transcoder(sample_rate) {}

  /// @brief Replace the payload type map (from the negotiated description)
  void payload_map(codec::PayloadMap map) noexcept {
    std::scoped_lock lck(mtx);
    pt_map = std::move(map);
  }

  /// @brief Handle one received packet.  RTCP is skipped, failures drop
  ///        only this packet.
  /// @param packet received bytes
  /// @return error_code, bad_packet, unsupported_codec or decode_failed
  ///         when the packet was dropped
  error_code handle(std::span<const uint8_t> packet) noexcept;

  uint64_t packets() const noexcept { return packets_in.load(); }
  uint64_t dropped() const noexcept { return packets_dropped.load(); }
  uint64_t forwarded() const noexcept { return packets_forwarded.load(); }

private:
  error_code drop(error_code ec, uint8_t pt) noexcept;

private:
  // order dependent
  bridge::Registry &registry;
  codec::Transcoder transcoder;

  // order independent
  std::mutex mtx;
  codec::PayloadMap pt_map;
  uint8v pcm;
  std::atomic<uint64_t> packets_in{0};
  std::atomic<uint64_t> packets_dropped{0};
  std::atomic<uint64_t> packets_forwarded{0};

public:
  MOD_ID("media.inbound");
};

} // namespace media
} // namespace parley
