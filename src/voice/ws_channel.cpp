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

#include "voice/ws_channel.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "base/threads.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace parley {
namespace voice {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

// bounds the closing handshake, reads wait on the server indefinitely
static websocket::stream_base::timeout session_timeout() noexcept {
  return websocket::stream_base::timeout{.handshake_timeout = std::chrono::seconds(5),
                                         .idle_timeout = websocket::stream_base::none(),
                                         .keep_alive_pings = false};
}

WsChannel::WsChannel(Millis dial_timeout) noexcept
    : dial_timeout(dial_timeout),                // order dependent
      guard(asio::make_work_guard(io_ctx)),      //
      ssl_ctx(ssl::context::tls_client),         //
      resolver(io_ctx),                          //
      dial_timer(io_ctx) {
  ssl_ctx.set_verify_mode(ssl::verify_peer);

  if (error_code ec; ssl_ctx.set_default_verify_paths(ec), ec) {
    INFO_INIT("default verify paths unavailable, {}", ec);
  }

  thread = std::jthread([this]() {
    name_thread("voice_ws");
    io_ctx.run();
  });
}

WsChannel::~WsChannel() noexcept {
  close();

  // the closing handshake and aborted operations drain, then run() returns
  guard.reset();
  if (thread.joinable()) thread.join();
}

error_code WsChannel::dial(const string &url_str) noexcept {
  INFO_AUTO_CAT("dial");

  Url u;
  if (!Url::parse(url_str, u)) {
    INFO_AUTO("invalid join url {}", url_str);
    return errc::make_error_code(errc::invalid_argument);
  }

  std::promise<error_code> done;
  auto result = done.get_future();

  asio::post(io_ctx, [this, u = std::move(u), done = std::move(done)]() mutable {
    if (closed.test()) {
      done.set_value(asio::error::operation_aborted);
      return;
    }

    url = std::move(u);
    dialing.emplace(std::move(done));

    if (url.secure()) {
      auto s = std::make_unique<tls_ws>(io_ctx, ssl_ctx);

      if (!SSL_set_tlsext_host_name(s->next_layer().native_handle(), url.host.c_str())) {
        dial_done(error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
        return;
      }

      s->next_layer().set_verify_callback(ssl::host_name_verification(url.host));
      ws = std::move(s);
    } else {
      ws = std::make_unique<plain_ws>(io_ctx);
    }

    dial_timer.expires_after(dial_timeout);
    dial_timer.async_wait([this](const error_code &ec) {
      if (ec || !dialing) return;

      dial_done(asio::error::timed_out);
      abort();
    });

    resolver.async_resolve(url.host, url.port,
                           [this](const error_code &ec, tcp::resolver::results_type endpoints) {
                             resolved(ec, endpoints);
                           });
  });

  const auto ec = result.get();

  if (ec) {
    INFO_AUTO("{} failed, {}", url_str, ec);
  } else {
    INFO_AUTO("connected {}", url_str);
  }

  return ec;
}

void WsChannel::dial_done(error_code ec) noexcept {
  dial_timer.cancel();

  if (dialing) {
    dialing->set_value(ec);
    dialing.reset();
  }
}

void WsChannel::resolved(const error_code &ec,
                         const tcp::resolver::results_type &endpoints) noexcept {
  if (!dialing) return;
  if (ec) return dial_done(ec);

  std::visit(overloaded{[this](std::monostate) { dial_done(asio::error::not_connected); },
                        [&, this](auto &s) {
                          beast::get_lowest_layer(*s).async_connect(
                              endpoints, [this](const error_code &ec, const tcp::endpoint &) {
                                connected(ec);
                              });
                        }},
             ws);
}

void WsChannel::connected(const error_code &ec) noexcept {
  if (!dialing) return;
  if (ec) return dial_done(ec);

  std::visit(overloaded{[this](std::monostate) { dial_done(asio::error::not_connected); },
                        [this](std::unique_ptr<plain_ws> &) { upgrade(); },
                        [this](std::unique_ptr<tls_ws> &s) {
                          s->next_layer().async_handshake(ssl::stream_base::client,
                                                          [this](const error_code &ec) {
                                                            if (!dialing) return;
                                                            if (ec) return dial_done(ec);

                                                            upgrade();
                                                          });
                        }},
             ws);
}

void WsChannel::upgrade() noexcept {
  std::visit(
      overloaded{[this](std::monostate) { dial_done(asio::error::not_connected); },
                 [this](auto &s) {
                   s->set_option(websocket::stream_base::decorator([](websocket::request_type &req) {
                     req.set(beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
                   }));

                   s->async_handshake(url.host_header(), url.target, [this, &s](const error_code &ec) {
                     if (!dialing) return;

                     if (!ec) {
                       s->set_option(session_timeout());

                       {
                         std::scoped_lock lck(mtx);
                         reading = true;
                       }

                       read_next();
                     }

                     dial_done(ec);
                   });
                 }},
      ws);
}

void WsChannel::read_next() noexcept {
  std::visit(overloaded{[](std::monostate) {},
                        [this](auto &s) {
                          s->async_read(buffer, [this, &s](const error_code &ec, std::size_t) {
                            received(ec, s->got_binary());
                          });
                        }},
             ws);
}

void WsChannel::received(const error_code &ec, bool binary) noexcept {
  INFO_AUTO_CAT("read");

  {
    std::scoped_lock lck(mtx);

    if (ec) {
      reading = false;
    } else {
      const auto data = buffer.cdata();

      frames.emplace_back(Frame{.kind = binary ? Frame::Binary : Frame::Text,
                                .payload = uint8v(std::span<const uint8_t>(
                                    static_cast<const uint8_t *>(data.data()), data.size()))});
      buffer.consume(buffer.size());
    }
  }

  cv.notify_all();

  if (ec) {
    if (!closed.test()) INFO_AUTO("failed, {}", ec);
    return;
  }

  read_next();
}

error_code WsChannel::read(Frame &frame) noexcept {
  std::unique_lock lck(mtx);

  cv.wait(lck, [this]() { return !frames.empty() || !reading || closed.test(); });

  if (closed.test() || frames.empty()) return make_error_code(err::transport_read);

  frame = std::move(frames.front());
  frames.pop_front();

  return error_code();
}

error_code WsChannel::write_binary(std::span<const uint8_t> pcm) noexcept {
  if (closed.test()) return make_error_code(err::send_failure);

  // one write in flight
  std::scoped_lock lck(write_mtx);

  std::promise<error_code> done;
  auto result = done.get_future();

  asio::post(io_ctx, [this, msg = uint8v(pcm), done = std::move(done)]() mutable {
    std::visit(overloaded{[&](std::monostate) { done.set_value(asio::error::not_connected); },
                          [&](auto &s) {
                            const auto buf = asio::buffer(msg.data(), msg.size());

                            s->binary(true);
                            s->async_write(buf, [msg = std::move(msg), done = std::move(done)](
                                                    const error_code &ec, std::size_t) mutable {
                              done.set_value(ec);
                            });
                          }},
               ws);
  });

  return result.get() ? make_error_code(err::send_failure) : error_code();
}

void WsChannel::close() noexcept {
  if (closed.test_and_set()) return;

  asio::post(io_ctx, [this]() { abort(); });

  // wake a blocked reader
  { std::scoped_lock lck(mtx); }
  cv.notify_all();
}

void WsChannel::abort() noexcept {
  dial_done(asio::error::operation_aborted);
  resolver.cancel();

  std::visit(overloaded{[](std::monostate) {},
                        [](auto &s) {
                          if (s->is_open()) {
                            s->async_close(websocket::close_code::normal,
                                           [&s](const error_code &) {
                                             beast::get_lowest_layer(*s).close();
                                           });
                          } else {
                            beast::get_lowest_layer(*s).close();
                          }
                        }},
             ws);
}

} // namespace voice
} // namespace parley
