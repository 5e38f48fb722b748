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
#include "base/conf/token.hpp"
#include "base/types.hpp"
#include "bridge/registry.hpp"
#include "bridge/session.hpp"
#include "media/inbound.hpp"
#include "media/negotiation.hpp"
#include "media/peer.hpp"
#include "voice/connector.hpp"
#include "voice/relay.hpp"

#include <atomic>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace parley {
namespace bridge {

/// @brief Creates a negotiation per offer and, once its media connects,
///        a session joined to a voice call.  Teardown runs on the io_context
///        and never waits on a relay: stopped relays are joined by the
///        reaper thread.
class Bridge {
  struct Entry {
    std::shared_ptr<media::Negotiation> negotiation;
    std::shared_ptr<media::Inbound> inbound;
    std::shared_ptr<Session> session;
    std::unique_ptr<voice::Relay> relay;
  };

public:
  Bridge(asio::io_context &io_ctx, Registry &registry, media::PeerFactory peer_factory,
         voice::Connector &connector, const Session::Opts &opts) noexcept;

  ~Bridge() noexcept { shutdown(); }

  Bridge(const Bridge &) = delete;
  Bridge &operator=(const Bridge &) = delete;

  /// @brief Session options from the [media] table
  static Session::Opts session_opts(const conf::token &tokc) noexcept;

  /// @brief Answer a browser offer
  /// @param offer_sdp remote offer
  /// @param answer_sdp populated with the answer
  /// @return error_code, negotiation_failed when the peer cannot answer
  error_code offer(const string &offer_sdp, string &answer_sdp) noexcept;

  /// @brief Stop every relay, release the registry and close every peer
  void shutdown() noexcept;

  std::size_t live() const noexcept {
    std::scoped_lock lck(mtx);
    return entries.size();
  }

  /// @brief Stopped relays not yet joined
  std::size_t reaping() const noexcept {
    std::scoped_lock lck(reap_mtx);
    return retired.size() + (joining ? 1 : 0);
  }

private:
  void connected(std::shared_ptr<media::Negotiation> n) noexcept;
  void closed(std::shared_ptr<media::Negotiation> n) noexcept;
  void teardown(Entry &entry) noexcept;
  void retire(std::unique_ptr<voice::Relay> relay) noexcept;
  void reap(std::stop_token stoken) noexcept;

private:
  // order dependent
  asio::io_context &io_ctx;
  Registry &registry;
  media::PeerFactory peer_factory;
  voice::Connector &connector;
  const Session::Opts opts;

  // order independent
  mutable std::mutex mtx;
  std::list<Entry> entries;
  std::atomic_flag shutting_down;

  mutable std::mutex reap_mtx;
  std::condition_variable_any reap_cv;
  std::list<std::unique_ptr<voice::Relay>> retired;
  bool joining{false};
  std::jthread reaper;

public:
  MOD_ID("bridge");
};

} // namespace bridge
} // namespace parley
