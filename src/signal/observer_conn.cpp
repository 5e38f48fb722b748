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

#include "signal/observer_conn.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

namespace parley {
namespace signal {

namespace beast = boost::beast;
namespace websocket = beast::websocket;

void ObserverConn::start(request_t req) noexcept {
  upgrade_req = std::move(req);

  ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));

  asio::dispatch(ws.get_executor(), [self = shared_from_this()]() {
    self->ws.async_accept(self->upgrade_req, [self](const error_code &ec) {
      INFO_AUTO_CAT("accept");

      if (ec) {
        INFO_AUTO("upgrade failed, {}", ec);
        return self->finish(ec);
      }

      if (self->closed.test()) return self->finish(asio::error::operation_aborted);

      self->registry.attach_observer(self);

      error_code ep_ec;
      if (const auto ep = beast::get_lowest_layer(self->ws).socket().remote_endpoint(ep_ec);
          !ep_ec) {
        INFO_AUTO("attached {}:{}", ep.address().to_string(), ep.port());
      }

      self->read_next();
    });
  });
}

void ObserverConn::read_next() noexcept {
  buffer.clear();

  ws.async_read(buffer, [self = shared_from_this()](const error_code &ec, std::size_t) {
    if (ec) return self->finish(ec);

    if (self->ws.got_text()) {
      INFO("received", "{}", beast::buffers_to_string(self->buffer.cdata()));
    }

    self->read_next();
  });
}

error_code ObserverConn::mirror(csv text) noexcept {
  if (closed.test()) return make_error_code(err::send_failure);

  asio::post(ws.get_executor(), [self = shared_from_this(), msg = string(text)]() mutable {
    if (self->closed.test()) return;

    self->pending.emplace_back(std::move(msg));

    // a write is already in flight, it continues with this one
    if (self->pending.size() == 1) self->write_next();
  });

  return error_code();
}

void ObserverConn::write_next() noexcept {
  ws.text(true);

  ws.async_write(asio::buffer(pending.front()),
                 [self = shared_from_this()](const error_code &ec, std::size_t) {
                   if (ec) {
                     INFO("mirror", "write failed, {}", ec);
                     self->pending.clear();
                     return;
                   }

                   self->pending.pop_front();
                   if (!self->pending.empty()) self->write_next();
                 });
}

void ObserverConn::finish(const error_code &ec) noexcept {
  INFO_AUTO_CAT("finish");

  if (!closed.test_and_set()) INFO_AUTO("read failed, {}", ec);

  // an in flight write fails once the socket closes and drops the queue
  registry.detach_observer(shared_from_this());

  beast::get_lowest_layer(ws).close();
}

void ObserverConn::close() noexcept {
  if (closed.test_and_set()) return;

  asio::post(ws.get_executor(), [self = shared_from_this()]() {
    if (self->ws.is_open()) {
      // the read completes once the close handshake ends, finish() runs there
      self->ws.async_close(websocket::close_code::going_away,
                           [self](const error_code &) { beast::get_lowest_layer(self->ws).close(); });
    } else {
      beast::get_lowest_layer(self->ws).close();
    }
  });
}

} // namespace signal
} // namespace parley
