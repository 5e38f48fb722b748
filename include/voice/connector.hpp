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
#include "voice/call_request.hpp"
#include "voice/channel.hpp"

#include <memory>
#include <stop_token>

namespace parley {
namespace voice {

/// @brief Source of voice calls and the channels that join them
class Connector {
public:
  virtual ~Connector() = default;

  /// @brief Create a call, blocks until the service responds
  /// @param call populated with the created call
  /// @param stoken a stop request abandons the request
  /// @return error_code, call_create_failed on any failure
  virtual error_code create_call(Call &call, std::stop_token stoken) noexcept = 0;

  /// @brief Create an undialed channel
  virtual std::unique_ptr<Channel> make_channel() noexcept = 0;
};

} // namespace voice
} // namespace parley
