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

#include "base/conf/token.hpp"
#include "base/types.hpp"
#include "voice/call_request.hpp"
#include "voice/client.hpp"
#include "voice/connector.hpp"

namespace parley {
namespace voice {

/// @brief Connector configured from the [voice] table, creates calls with
///        the REST client and joins them over a websocket
class Service : public Connector {
public:
  /// @brief Service configured from the master configuration
  Service() noexcept : Service(conf::token(module_id)) {}

  explicit Service(conf::token tokc) noexcept;

  /// @brief Build the call request described by a [voice] table,
  ///        absent keys take the built in defaults
  /// @param tokc token rooted at the voice table
  /// @return CallRequest
  static CallRequest make_request(const conf::token &tokc) noexcept;

  const CallRequest &request() const noexcept { return req; }

  error_code create_call(Call &call, std::stop_token stoken) noexcept override;
  std::unique_ptr<Channel> make_channel() noexcept override;

private:
  // order dependent
  conf::token tokc;
  CallRequest req;
  Client client;
  const Millis dial_timeout;

public:
  MOD_ID("voice");
};

} // namespace voice
} // namespace parley
