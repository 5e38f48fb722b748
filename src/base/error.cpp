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

#include "base/error.hpp"

namespace parley {

namespace {

class category_impl : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "parley"; }

  std::string message(int ev) const override {
    switch (static_cast<err>(ev)) {
    case err::ok:
      return "success";
    case err::negotiation_failed:
      return "negotiation failed";
    case err::unsupported_codec:
      return "unsupported codec";
    case err::transport_read:
      return "transport read failed";
    case err::malformed_control:
      return "malformed control message";
    case err::send_failure:
      return "send failure";
    case err::call_create_failed:
      return "call create failed";
    case err::decode_failed:
      return "decode failed";
    case err::bad_packet:
      return "bad packet";
    }

    return "unknown";
  }
};

} // namespace

const boost::system::error_category &parley_category() noexcept {
  static const category_impl category;

  return category;
}

error_code make_error_code(err e) noexcept {
  return error_code(static_cast<int>(e), parley_category());
}

} // namespace parley
