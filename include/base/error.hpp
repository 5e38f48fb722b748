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

#include <boost/system/error_code.hpp>
#include <fmt/format.h>
#include <type_traits>

namespace parley {

/// @brief Failures reported by parley modules.  Values are carried
///        in a boost::system::error_code using the parley category.
enum class err : int {
  ok = 0,
  negotiation_failed, // remote description, answer creation or gathering failed
  unsupported_codec,  // codec id outside the negotiated set
  transport_read,     // read from a transport failed or closed
  malformed_control,  // control frame not json or missing a string type
  send_failure,       // write to a transport failed
  call_create_failed, // voice call creation request failed
  decode_failed,      // stateful decoder rejected a packet
  bad_packet          // rtp packet too short or malformed
};

/// @brief The parley error category
/// @return reference to the singleton category
const boost::system::error_category &parley_category() noexcept;

/// @brief Create an error_code within the parley category
/// @param e error value
/// @return error_code
error_code make_error_code(err e) noexcept;

/// @brief Is the error_code a specific parley error
/// @param ec error code to test
/// @param e error to compare against
/// @return boolean
inline bool is_err(const error_code &ec, err e) noexcept {
  return (ec.category() == parley_category()) && (ec.value() == static_cast<int>(e));
}

} // namespace parley

namespace boost {
namespace system {
template <> struct is_error_code_enum<parley::err> : std::true_type {};
} // namespace system
} // namespace boost

template <> struct fmt::formatter<parley::error_code> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const parley::error_code &ec, FormatContext &ctx) const -> decltype(ctx.out()) {
    return formatter<std::string>::format(ec.message(), ctx);
  }
};
