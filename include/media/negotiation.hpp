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
#include "base/elapsed.hpp"
#include "base/types.hpp"
#include "base/uuid.hpp"
#include "media/peer.hpp"

#include <atomic>
#include <functional>
#include <memory>

namespace parley {
namespace media {

/// @brief Offer/answer with a Peer and the connection state transitions
///        that drive session creation and teardown.
///
///        on_connected fires exactly once, on the first Connected state.
///        on_closed fires exactly once, on the first Disconnected, Failed
///        or Closed state.
class Negotiation : public std::enable_shared_from_this<Negotiation> {
public:
  using handler = std::function<void(std::shared_ptr<Negotiation>)>;

  struct Handlers {
    handler on_connected;
    handler on_closed;
  };

private:
  Negotiation(std::unique_ptr<Peer> peer, Handlers &&handlers) noexcept
      : peer(std::move(peer)), handlers(std::move(handlers)) {}

public:
  static std::shared_ptr<Negotiation> create(std::unique_ptr<Peer> peer,
                                             Handlers &&handlers) noexcept {
    return std::shared_ptr<Negotiation>(new Negotiation(std::move(peer), std::move(handlers)));
  }

  /// @brief Create the answer for a remote offer
  /// @param offer_sdp remote offer
  /// @param answer_sdp populated with the answer
  /// @return error_code, negotiation_failed when the peer fails
  error_code accept(const string &offer_sdp, string &answer_sdp) noexcept;

  /// @brief Connection state transition (invoked by the peer)
  /// @param next new state
  void state_changed(PeerState next) noexcept;

  Peer &media_peer() noexcept { return *peer; }

  bool connected() const noexcept { return connected_fired.test(); }
  bool closed() const noexcept { return closed_fired.test(); }

  const UUID &id() const noexcept { return uuid; }

private:
  // order dependent
  std::unique_ptr<Peer> peer;
  Handlers handlers;

  // order independent
  const UUID uuid;
  std::atomic_flag connected_fired;
  std::atomic_flag closed_fired;
  Elapsed e;

public:
  MOD_ID("media.negotiation");
};

} // namespace media
} // namespace parley
