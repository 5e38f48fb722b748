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
#include "codec/ids.hpp"
#include "rtp/sink.hpp"

#include <fmt/format.h>
#include <functional>
#include <memory>
#include <span>

namespace parley {
namespace media {

enum class PeerState : uint8_t { New = 0, Connecting, Connected, Disconnected, Failed, Closed };

inline constexpr bool is_terminal(PeerState s) noexcept {
  return (s == PeerState::Disconnected) || (s == PeerState::Failed) || (s == PeerState::Closed);
}

/// @brief Real-time media engine seam: offer/answer, connection state and
///        the single audio track in both directions
class Peer {
public:
  using state_handler = std::function<void(PeerState)>;
  using packet_handler = std::function<void(std::span<const uint8_t>)>;

public:
  virtual ~Peer() = default;

  /// @brief Apply the remote offer and create the local answer
  /// @param offer_sdp remote offer
  /// @param answer_sdp populated with the local answer (gathering complete)
  /// @return error_code, negotiation_failed on any failure
  virtual error_code negotiate(const string &offer_sdp, string &answer_sdp) noexcept = 0;

  /// @brief Register the connection state handler (before negotiate)
  virtual void on_state(state_handler h) noexcept = 0;

  /// @brief Register the handler for packets received on the audio track
  virtual void on_packet(packet_handler h) noexcept = 0;

  /// @brief Payload type to codec map of the negotiated audio section
  virtual codec::PayloadMap payload_map() const noexcept = 0;

  /// @brief Sink writing to the audio track
  virtual std::shared_ptr<rtp::Sink> outbound() noexcept = 0;

  virtual void close() noexcept = 0;
};

using PeerFactory = std::function<std::unique_ptr<Peer>()>;

} // namespace media
} // namespace parley

template <> struct fmt::formatter<parley::media::PeerState> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(parley::media::PeerState s, FormatContext &ctx) const -> decltype(ctx.out()) {
    static constexpr std::string_view names[]{"new",          "connecting", "connected",
                                              "disconnected", "failed",     "closed"};

    return formatter<std::string_view>::format(names[static_cast<uint8_t>(s)], ctx);
  }
};
