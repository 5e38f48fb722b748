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
#include "bridge/observer.hpp"
#include "bridge/registry.hpp"

#include <atomic>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <memory>

namespace parley {
namespace signal {

/// @brief Websocket connection receiving mirrored control messages.
///        Attaches itself to the registry for the life of the connection.
///
///        Every stream operation runs on the socket's executor (a strand
///        per accepted connection); mirror() and close() post to it.
class ObserverConn : public bridge::Observer, public std::enable_shared_from_this<ObserverConn> {
  using ws_t = boost::beast::websocket::stream<boost::beast::tcp_stream>;

public:
  using request_t = boost::beast::http::request<boost::beast::http::string_body>;

private:
  ObserverConn(tcp_socket &&sock, bridge::Registry &registry) noexcept
      : ws(std::move(sock)), registry(registry) {}

public:
  static std::shared_ptr<ObserverConn> create(tcp_socket &&sock,
                                              bridge::Registry &registry) noexcept {
    return std::shared_ptr<ObserverConn>(new ObserverConn(std::move(sock), registry));
  }

  /// @brief Complete the upgrade, attach to the registry and read until
  ///        the connection fails.  Returns at once.
  /// @param req the upgrade request
  void start(request_t req) noexcept;

  /// @brief Queue a text message, written in order
  error_code mirror(csv text) noexcept override;

  /// @brief Close the connection.  Idempotent.
  void close() noexcept;

  bool is_closed() const noexcept { return closed.test(); }

private:
  // all below run on the socket's executor
  void read_next() noexcept;
  void write_next() noexcept;
  void finish(const error_code &ec) noexcept;

private:
  // order dependent
  ws_t ws;
  bridge::Registry &registry;

  // order independent
  request_t upgrade_req;
  boost::beast::flat_buffer buffer;
  std::deque<string> pending;
  std::atomic_flag closed;

public:
  MOD_ID("signal.observer");
};

} // namespace signal
} // namespace parley
