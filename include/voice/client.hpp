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
#include "voice/call_request.hpp"
#include "voice/url.hpp"

#include <stop_token>

namespace parley {
namespace voice {

/// @brief Voice service REST client, creates calls
class Client {
public:
  static constexpr csv DEFAULT_API_BASE{"https://api.ultravox.ai/api"};
  static constexpr csv API_KEY_ENV{"ULTRAVOX_API_KEY"};

  struct Opts {
    string api_key;
    string api_base{DEFAULT_API_BASE};
    Millis timeout{15s};
  };

  struct Response {
    int status{0};
    string body;

    bool success() const noexcept { return (status >= 200) && (status < 300); }
  };

public:
  /// @brief Create a client.  An empty api key falls back to the
  ///        ULTRAVOX_API_KEY environment variable.
  Client(Opts opts) noexcept;

  const string &api_base() const noexcept { return opts.api_base; }
  bool has_api_key() const noexcept { return !opts.api_key.empty(); }

  /// @brief Create a call and obtain its join url
  /// @param req call parameters
  /// @param call populated from the response
  /// @param stoken a stop request abandons an outstanding request
  /// @return error_code, call_create_failed when the api key is missing
  ///         (no request is made), the status is not 2xx, the request
  ///         times out or the response has no join url
  error_code create_call(const CallRequest &req, Call &call,
                         std::stop_token stoken = std::stop_token()) noexcept;

  /// @brief POST a json body, bounded by the timeout
  /// @param url target
  /// @param body request body
  /// @param resp populated response
  /// @param stoken a stop request abandons the request
  /// @return error_code, timed_out when the timeout expires, operation_aborted
  ///         on a stop request
  error_code post(const Url &url, const string &body, Response &resp,
                  std::stop_token stoken = std::stop_token()) noexcept;

private:
  // order dependent
  Opts opts;

public:
  MOD_ID("voice.client");
};

} // namespace voice
} // namespace parley
