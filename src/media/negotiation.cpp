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

#include "media/negotiation.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "base/stats.hpp"

namespace parley {
namespace media {

error_code Negotiation::accept(const string &offer_sdp, string &answer_sdp) noexcept {
  INFO_AUTO_CAT("accept");

  // handlers hold a weak reference, the bridge owns the negotiation
  peer->on_state([w = weak_from_this()](PeerState next) {
    if (auto self = w.lock(); self) self->state_changed(next);
  });

  e.reset();
  auto ec = peer->negotiate(offer_sdp, answer_sdp);

  Stats::write(stats::NEGOTIATE_ELAPSED, e());

  if (ec) {
    INFO_AUTO("{:s} failed, {}", uuid, ec);
    return make_error_code(err::negotiation_failed);
  }

  INFO_AUTO("{:s} answer bytes={} elapsed={}", uuid, answer_sdp.size(), e.humanize());

  return ec;
}

void Negotiation::state_changed(PeerState next) noexcept {
  INFO_AUTO_CAT("state");

  INFO_AUTO("{:s} {}", uuid, next);

  if ((next == PeerState::Connected) && !closed_fired.test()) {
    if (!connected_fired.test_and_set() && handlers.on_connected) {
      handlers.on_connected(shared_from_this());
    }

  } else if (is_terminal(next)) {
    if (!closed_fired.test_and_set() && handlers.on_closed) {
      handlers.on_closed(shared_from_this());
    }
  }
}

} // namespace media
} // namespace parley
