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
#include "bridge/registry.hpp"
#include "signal/observer_conn.hpp"

#include <atomic>
#include <boost/beast/http.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace parley {
namespace signal {

/// @brief Answers an offer sdp, see bridge::Bridge::offer()
using offer_handler = std::function<error_code(const string &offer_sdp, string &answer_sdp)>;

/// @brief What a connection needs to serve requests
struct Routes {
  offer_handler offer;
  bridge::Registry *registry{nullptr};
  string web_root; // empty disables static files
};

/// @brief One HTTP/1.1 connection served on its own thread.  A GET /ws
///        upgrade hands the socket to an ObserverConn, which runs on the
///        socket's executor, and ends the thread.
class HttpConn {
public:
  using request_t = boost::beast::http::request<boost::beast::http::string_body>;
  using response_t = boost::beast::http::response<boost::beast::http::string_body>;

public:
  HttpConn(tcp_socket &&sock, const Routes &routes) noexcept
      : sock(std::move(sock)), routes(routes) {}

  ~HttpConn() noexcept { close(); }

  HttpConn(const HttpConn &) = delete;
  HttpConn &operator=(const HttpConn &) = delete;

  /// @brief Serve requests on a new thread
  void start() noexcept;

  /// @brief Unblock the connection thread and join it.  Idempotent.
  void close() noexcept;

  /// @brief The thread has exited and any observer it handed off has closed
  bool finished() const noexcept {
    if (!done.test()) return false;

    std::scoped_lock lck(mtx);
    return !observer || observer->is_closed();
  }

  /// @brief Response to a plain (non upgrade) request
  /// @param req request
  /// @param routes handlers and settings
  /// @return response
  static response_t respond(const request_t &req, const Routes &routes) noexcept;

private:
  void run(std::stop_token stoken) noexcept;

  static response_t offer(const request_t &req, const Routes &routes) noexcept;
  static response_t file(const request_t &req, csv path, const Routes &routes) noexcept;
  static response_t error(const request_t &req, boost::beast::http::status status,
                          csv msg) noexcept;

private:
  // order dependent
  tcp_socket sock;
  const Routes routes;

  // order independent
  mutable std::mutex mtx;
  std::shared_ptr<ObserverConn> observer;
  std::atomic_flag closing;
  std::atomic_flag done;
  std::jthread thread;

public:
  MOD_ID("signal.http");
};

} // namespace signal
} // namespace parley
