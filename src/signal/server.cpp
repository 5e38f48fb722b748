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

#include "signal/server.hpp"
#include "base/logger.hpp"

#include <boost/asio/ip/address.hpp>

namespace parley {
namespace signal {

Server::Server(asio::io_context &io_ctx, const conf::token &tokc, Routes routes) noexcept
    : io_ctx(io_ctx), routes(std::move(routes)), acceptor(io_ctx) {
  INFO_AUTO_CAT("init");

  if (this->routes.web_root.empty()) this->routes.web_root = tokc.val("web_root", "");

  const auto addr_str = tokc.val("address", "0.0.0.0");
  const auto port = tokc.val<Port>("port", 8080);

  error_code ec;
  const auto addr = asio::ip::make_address(addr_str, ec);

  if (ec) {
    INFO_AUTO("invalid address {}, {}", addr_str, ec);
    return;
  }

  const tcp_endpoint endpoint(addr, port);

  if (acceptor.open(endpoint.protocol(), ec); !ec) {
    acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    acceptor.set_option(asio::socket_base::enable_connection_aborted(true), ec);
  }

  if (!ec) acceptor.bind(endpoint, ec);
  if (!ec) acceptor.listen(asio::socket_base::max_listen_connections, ec);

  if (ec) {
    INFO_AUTO("listen {}:{} failed, {}", addr_str, port, ec);

    error_code close_ec;
    if (acceptor.close(close_ec); close_ec) INFO_AUTO("close failed, {}", close_ec);

    return;
  }

  INFO_AUTO("listening {}:{} web_root={}", addr_str, this->port(), this->routes.web_root);

  async_accept();
}

Port Server::port() const noexcept {
  error_code ec;

  const auto ep = acceptor.local_endpoint(ec);

  return ec ? 0 : ep.port();
}

void Server::async_accept() noexcept {
  INFO_AUTO_CAT("async_accept");

  // each connection gets its own strand, an upgraded observer runs its stream there
  acceptor.async_accept(asio::make_strand(io_ctx), [this](error_code ec, tcp_socket peer) mutable {
    if (!ec && acceptor.is_open()) {
      std::scoped_lock lck(mtx);

      // finished connections have exited their thread, joining is immediate
      std::erase_if(conns, [](const auto &conn) { return conn->finished(); });

      conns.emplace_back(std::make_unique<HttpConn>(std::move(peer), routes))->start();

      async_accept(); // schedule the next accept
    } else if (ec != asio::error::operation_aborted) {
      INFO_AUTO("failed, {}", ec);
    }
  });
}

void Server::close_all() noexcept {
  INFO_AUTO_CAT("close_all");

  std::list<std::unique_ptr<HttpConn>> all;

  {
    std::scoped_lock lck(mtx);
    all.swap(conns);
  }

  for (auto &conn : all) {
    conn->close();
  }

  INFO_AUTO("closed connections={}", all.size());
}

void Server::shutdown() noexcept {
  if (acceptor.is_open()) {
    error_code ec;

    if (acceptor.close(ec); ec) INFO("shutdown", "acceptor close {}", ec);
  }

  close_all();
}

} // namespace signal
} // namespace parley
