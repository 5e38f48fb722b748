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
#include "base/dura_t.hpp"
#include "base/types.hpp"
#include "voice/channel.hpp"
#include "voice/url.hpp"

#include <atomic>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>

namespace parley {
namespace voice {

/// @brief Websocket (ws or wss) channel to a voice session.
///
///        The stream is driven by async operations on a private io_context
///        run by the channel's own thread.  Callers never touch the stream:
///        dial and writes are posted and awaited, received frames are
///        queued for read() and close() is posted.
class WsChannel : public Channel {
  using plain_ws = boost::beast::websocket::stream<boost::beast::tcp_stream>;
  using tls_ws =
      boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;
  using ws_v = std::variant<std::monostate, std::unique_ptr<plain_ws>, std::unique_ptr<tls_ws>>;

public:
  static constexpr Millis DIAL_TIMEOUT{15s};

public:
  /// @param dial_timeout bounds resolve, connect and both handshakes
  WsChannel(Millis dial_timeout = DIAL_TIMEOUT) noexcept;
  ~WsChannel() noexcept override;

  WsChannel(const WsChannel &) = delete;
  WsChannel &operator=(const WsChannel &) = delete;

  error_code dial(const string &url) noexcept override;
  error_code read(Frame &frame) noexcept override;
  error_code write_binary(std::span<const uint8_t> pcm) noexcept override;
  void close() noexcept override;

private:
  // all below run on the channel thread
  void abort() noexcept;
  void dial_done(error_code ec) noexcept;
  void resolved(const error_code &ec, const asio::ip::tcp::resolver::results_type &endpoints) noexcept;
  void connected(const error_code &ec) noexcept;
  void upgrade() noexcept;
  void read_next() noexcept;
  void received(const error_code &ec, bool binary) noexcept;

private:
  // order dependent
  const Millis dial_timeout;
  asio::io_context io_ctx;
  asio::executor_work_guard<asio::io_context::executor_type> guard;
  asio::ssl::context ssl_ctx;
  asio::ip::tcp::resolver resolver;
  asio::steady_timer dial_timer;

  // order independent, channel thread only
  ws_v ws;
  Url url;
  boost::beast::flat_buffer buffer;
  std::optional<std::promise<error_code>> dialing;

  // order independent, shared with readers
  std::mutex mtx;
  std::condition_variable cv;
  std::deque<Frame> frames;
  bool reading{false};

  // order independent
  std::mutex write_mtx;
  std::atomic_flag closed;
  std::jthread thread;

public:
  MOD_ID("voice.ws");
};

} // namespace voice
} // namespace parley
