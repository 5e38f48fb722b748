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
#include "signal/http_conn.hpp"

#include <list>
#include <memory>
#include <mutex>

namespace parley {
namespace signal {

/// @brief Accepts signaling connections on the app io_context
class Server {
public:
  /// @brief Bind and listen at [signal] address and port then start accepting
  /// @param io_ctx app io_context
  /// @param tokc token rooted at the signal table
  /// @param routes handlers for accepted connections (web_root is taken
  ///        from the token when not provided)
  Server(asio::io_context &io_ctx, const conf::token &tokc, Routes routes) noexcept;

  ~Server() noexcept { shutdown(); }

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  /// @brief Listening port (0 when not listening)
  Port port() const noexcept;

  bool listening() const noexcept { return acceptor.is_open(); }

  /// @brief Stop accepting and close all live connections.  Idempotent.
  void shutdown() noexcept;

  std::size_t live() const noexcept {
    std::scoped_lock lck(mtx);
    return conns.size();
  }

private:
  void async_accept() noexcept;
  void close_all() noexcept;

private:
  // order dependent
  asio::io_context &io_ctx;
  Routes routes;
  tcp_acceptor acceptor;

  // order independent
  mutable std::mutex mtx;
  std::list<std::unique_ptr<HttpConn>> conns;

public:
  MOD_ID("signal.server");
};

} // namespace signal
} // namespace parley
