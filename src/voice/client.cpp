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

#include "voice/client.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <cstdlib>
#include <functional>
#include <memory>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace parley {
namespace voice {

namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

using request_t = http::request<http::string_body>;
using response_t = http::response<http::string_body>;

// drives the operations of one request on a private io_context.  The
// deadline and a stop request both abandon the outstanding operation,
// including a resolve that would otherwise wait on the system resolver.
class Driver {
  struct Op {
    error_code ec;
    bool done{false};
  };

public:
  Driver(Millis timeout, std::stop_token stoken) noexcept
      : resolver(io_ctx), deadline(io_ctx),
        stop_cb(std::move(stoken), [this]() {
          asio::post(io_ctx, [this]() { abort(asio::error::operation_aborted); });
        }) {
    deadline.expires_after(timeout);
    deadline.async_wait([this](const error_code &ec) {
      if (!ec) abort(asio::error::timed_out);
    });
  }

  /// @brief Run one operation to completion, abandonment or failure
  template <typename Initiate> error_code run(Initiate &&initiate) noexcept {
    if (aborted) return aborted;

    auto op = std::make_shared<Op>();
    current = op;

    initiate([op](const error_code &ec, auto &&...) {
      if (!op->done) {
        op->ec = ec;
        op->done = true;
      }
    });

    while (!op->done && io_ctx.run_one()) {
    }

    current.reset();

    return op->done ? op->ec : error_code(asio::error::operation_aborted);
  }

  /// @brief The stream cancelled by abandonment
  void watch(beast::tcp_stream &s) noexcept { stream = &s; }

private:
  void abort(error_code ec) noexcept {
    if (aborted) return;

    aborted = ec;

    if (current) {
      current->ec = ec;
      current->done = true;
    }

    resolver.cancel();
    if (stream != nullptr) stream->cancel();
  }

public:
  // order dependent
  asio::io_context io_ctx;
  tcp::resolver resolver;

private:
  // order dependent
  asio::steady_timer deadline;
  std::stop_callback<std::function<void()>> stop_cb;

  // order independent
  beast::tcp_stream *stream{nullptr};
  std::shared_ptr<Op> current;
  error_code aborted;
};

template <typename Stream>
static error_code exchange(Driver &driver, Stream &stream, const request_t &req,
                           response_t &resp) noexcept {
  if (auto ec = driver.run([&](auto h) { http::async_write(stream, req, std::move(h)); }); ec) {
    return ec;
  }

  beast::flat_buffer buffer;
  return driver.run([&](auto h) { http::async_read(stream, buffer, resp, std::move(h)); });
}

Client::Client(Opts opts) noexcept : opts(std::move(opts)) {
  if (this->opts.api_key.empty()) {
    if (const char *env = std::getenv(API_KEY_ENV.data()); env != nullptr) {
      this->opts.api_key = env;
    }
  }
}

error_code Client::create_call(const CallRequest &req, Call &call,
                              std::stop_token stoken) noexcept {
  INFO_AUTO_CAT("create_call");

  if (opts.api_key.empty()) {
    INFO_AUTO("API key is required");
    return make_error_code(err::call_create_failed);
  }

  const auto url_str = req.url(opts.api_base);

  Url url;
  if (!Url::parse(url_str, url)) {
    INFO_AUTO("invalid url {}", url_str);
    return make_error_code(err::call_create_failed);
  }

  Response resp;
  if (auto ec = post(url, req.to_json(), resp, std::move(stoken)); ec) {
    INFO_AUTO("request failed, {}", ec);
    return make_error_code(err::call_create_failed);
  }

  if (!resp.success()) {
    INFO_AUTO("unexpected status {} {}", resp.status, resp.body);
    return make_error_code(err::call_create_failed);
  }

  if (auto ec = Call::parse(resp.body, call); ec) {
    INFO_AUTO("no join url in response");
    return ec;
  }

  INFO_AUTO("{}", call);

  return error_code();
}

error_code Client::post(const Url &url, const string &body, Response &resp,
                        std::stop_token stoken) noexcept {
  INFO_AUTO_CAT("post");

  // outlives the driver, an abandoned resolve may still complete into it
  tcp::resolver::results_type endpoints;
  Driver driver(opts.timeout, std::move(stoken));

  auto ec = driver.run([&](auto h) {
    driver.resolver.async_resolve(
        url.host, url.port,
        [&endpoints, h = std::move(h)](const error_code &op_ec,
                                       tcp::resolver::results_type r) mutable {
          endpoints = std::move(r);
          h(op_ec);
        });
  });

  if (ec) return ec;

  request_t req{http::verb::post, url.target, 11};
  req.set(http::field::host, url.host_header());
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(http::field::content_type, "application/json");
  req.set("X-API-Key", opts.api_key);
  req.body() = body;
  req.prepare_payload();

  response_t http_resp;

  if (url.secure()) {
    ssl::context ssl_ctx(ssl::context::tls_client);
    ssl_ctx.set_verify_mode(ssl::verify_peer);

    if (ssl_ctx.set_default_verify_paths(ec); ec) return ec;

    beast::ssl_stream<beast::tcp_stream> stream(driver.io_ctx, ssl_ctx);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
      return error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
    }

    stream.set_verify_callback(ssl::host_name_verification(url.host));
    driver.watch(beast::get_lowest_layer(stream));

    ec = driver.run([&](auto h) {
      beast::get_lowest_layer(stream).async_connect(endpoints, std::move(h));
    });

    if (!ec) {
      ec = driver.run(
          [&](auto h) { stream.async_handshake(ssl::stream_base::client, std::move(h)); });
    }

    if (!ec) ec = exchange(driver, stream, req, http_resp);

    if (!ec) {
      // servers commonly skip close_notify
      if (auto sd_ec = driver.run([&](auto h) { stream.async_shutdown(std::move(h)); });
          sd_ec && (sd_ec != asio::error::eof) && (sd_ec != ssl::error::stream_truncated)) {
        INFO_AUTO("tls shutdown {}", sd_ec);
      }
    }

  } else {
    beast::tcp_stream stream(driver.io_ctx);
    driver.watch(stream);

    ec = driver.run([&](auto h) { stream.async_connect(endpoints, std::move(h)); });
    if (!ec) ec = exchange(driver, stream, req, http_resp);

    if (!ec) {
      error_code sd_ec;
      if (stream.socket().shutdown(tcp_socket::shutdown_both, sd_ec); sd_ec) {
        INFO_AUTO("shutdown {}", sd_ec);
      }
    }
  }

  if (ec) return ec;

  resp.status = http_resp.result_int();
  resp.body = std::move(http_resp.body());

  return error_code();
}

} // namespace voice
} // namespace parley
