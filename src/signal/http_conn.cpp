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

#include "signal/http_conn.hpp"
#include "base/error.hpp"
#include "base/json.hpp"
#include "base/logger.hpp"
#include "base/threads.hpp"

#include <ArduinoJson.h>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace parley {
namespace signal {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace fs = std::filesystem;

static constexpr csv OFFER_PATH{"/api/sdp/offer"};
static constexpr csv WS_PATH{"/ws"};
static constexpr csv STATIC_PREFIX{"/static/"};

static csv target_path(const HttpConn::request_t &req) noexcept {
  csv target(req.target().data(), req.target().size());

  return target.substr(0, target.find('?'));
}

static csv content_type(const fs::path &p) noexcept {
  const auto ext = p.extension().string();

  if (ext == ".html") return "text/html";
  if (ext == ".js") return "application/javascript";
  if (ext == ".css") return "text/css";
  if (ext == ".json") return "application/json";
  if (ext == ".svg") return "image/svg+xml";
  if (ext == ".png") return "image/png";
  if (ext == ".ico") return "image/x-icon";

  return "application/octet-stream";
}

void HttpConn::start() noexcept {
  thread = std::jthread([this](std::stop_token stoken) {
    name_thread("http_conn");
    run(stoken);
  });
}

void HttpConn::close() noexcept {
  if (!closing.test_and_set()) {
    thread.request_stop();

    std::shared_ptr<ObserverConn> obs;

    {
      std::scoped_lock lck(mtx);
      obs = observer;

      if (error_code ec; !obs && sock.is_open()) {
        if (sock.shutdown(tcp_socket::shutdown_both, ec); ec && (ec != errc::not_connected)) {
          INFO("close", "shutdown {}", ec);
        }
      }
    }

    if (obs) obs->close();
  }

  if (thread.joinable() && (thread.get_id() != std::this_thread::get_id())) thread.join();
}

void HttpConn::run(std::stop_token stoken) noexcept {
  INFO_AUTO_CAT("run");

  beast::flat_buffer buffer;
  error_code ec;

  while (!stoken.stop_requested()) {
    request_t req;

    if (http::read(sock, buffer, req, ec); ec) {
      if ((ec != http::error::end_of_stream) && !closing.test()) INFO_AUTO("read failed, {}", ec);
      break;
    }

    if (websocket::is_upgrade(req) && (target_path(req) == WS_PATH) && routes.registry) {
      std::shared_ptr<ObserverConn> obs;

      {
        std::scoped_lock lck(mtx);
        obs = observer = ObserverConn::create(std::move(sock), *routes.registry);
      }

      obs->start(std::move(req));

      // close() may have run before the observer was published
      if (closing.test()) obs->close();

      break;
    }

    auto resp = respond(req, routes);

    if (http::write(sock, resp, ec); ec) {
      INFO_AUTO("write failed, {}", ec);
      break;
    }

    if (resp.need_eof()) break;
  }

  if (sock.is_open()) {
    if (sock.shutdown(tcp_socket::shutdown_send, ec); ec && (ec != errc::not_connected)) {
      INFO_AUTO("shutdown {}", ec);
    }
  }

  done.test_and_set();
}

HttpConn::response_t HttpConn::error(const request_t &req, http::status status, csv msg) noexcept {
  response_t resp{status, req.version()};

  resp.set(http::field::server, BOOST_BEAST_VERSION_STRING);
  resp.set(http::field::content_type, "text/plain");
  resp.keep_alive(req.keep_alive());
  resp.body() = fmt::format("{}\n", msg);
  resp.prepare_payload();

  return resp;
}

HttpConn::response_t HttpConn::respond(const request_t &req, const Routes &routes) noexcept {
  const auto path = target_path(req);

  if (path == OFFER_PATH) {
    if (req.method() != http::verb::post) {
      auto resp = error(req, http::status::method_not_allowed, "method not allowed");
      resp.set(http::field::allow, "POST");
      return resp;
    }

    return offer(req, routes);
  }

  if (path == WS_PATH) return error(req, http::status::bad_request, "websocket upgrade required");

  if (!routes.web_root.empty()) {
    if ((req.method() != http::verb::get) && (req.method() != http::verb::head)) {
      return error(req, http::status::method_not_allowed, "method not allowed");
    }

    if (path == "/") return file(req, "index.html", routes);

    if (path.starts_with(STATIC_PREFIX)) {
      return file(req, fmt::format("static/{}", path.substr(STATIC_PREFIX.size())), routes);
    }
  }

  return error(req, http::status::not_found, "not found");
}

HttpConn::response_t HttpConn::offer(const request_t &req, const Routes &routes) noexcept {
  INFO_AUTO_CAT("offer");

  const auto &body = req.body();
  DynamicJsonDocument doc(json::capacity(body));

  if (auto jerr = json::parse(body, doc); jerr) {
    INFO_AUTO("invalid body, {}", jerr.c_str());
    return error(req, http::status::bad_request, "Failed to parse SDP offer");
  }

  JsonVariantConst desc = doc["sdp"];
  const char *type = desc["type"] | "offer";
  const char *sdp = desc["sdp"] | "";

  if ((csv(type) != "offer") || (*sdp == '\0')) {
    return error(req, http::status::bad_request, "Failed to parse SDP offer");
  }

  string answer;
  if (auto ec = routes.offer ? routes.offer(sdp, answer) : make_error_code(err::negotiation_failed);
      ec) {
    return error(req, http::status::internal_server_error,
                 fmt::format("Failed to create answer: {}", ec.message()));
  }

  DynamicJsonDocument reply(1024 + answer.size() * 2);
  reply["type"] = "answer";

  JsonObject reply_sdp = reply.createNestedObject("sdp");
  reply_sdp["type"] = "answer";
  reply_sdp["sdp"] = answer;

  response_t resp{http::status::ok, req.version()};
  resp.set(http::field::server, BOOST_BEAST_VERSION_STRING);
  resp.set(http::field::content_type, "application/json");
  resp.keep_alive(req.keep_alive());
  serializeJson(reply, resp.body());
  resp.prepare_payload();

  return resp;
}

HttpConn::response_t HttpConn::file(const request_t &req, csv rel, const Routes &routes) noexcept {
  // confined to the web root
  if (rel.find("..") != csv::npos) return error(req, http::status::not_found, "not found");

  const fs::path p = fs::path(routes.web_root) / fs::path(rel);
  std::error_code fs_ec;

  if (!fs::is_regular_file(p, fs_ec)) {
    return error(req, http::status::not_found, "not found");
  }

  std::ifstream in(p, std::ios::binary);
  if (!in) return error(req, http::status::internal_server_error, "unreadable");

  response_t resp{http::status::ok, req.version()};
  resp.set(http::field::server, BOOST_BEAST_VERSION_STRING);
  resp.set(http::field::content_type, content_type(p));
  resp.keep_alive(req.keep_alive());

  if (req.method() == http::verb::get) {
    resp.body().assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  resp.prepare_payload();

  return resp;
}

} // namespace signal
} // namespace parley
