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
#include "base/uint8v.hpp"

#include <span>

namespace parley {
namespace voice {

/// @brief Persistent duplex message connection to a voice session
class Channel {
public:
  struct Frame {
    enum Kind : uint8_t { Text = 0, Binary };

    Kind kind{Text};
    uint8v payload;

    bool binary() const noexcept { return kind == Binary; }
  };

public:
  virtual ~Channel() = default;

  /// @brief Connect to the session join url
  /// @param url ws:// or wss:// join url
  /// @return error_code
  virtual error_code dial(const string &url) noexcept = 0;

  /// @brief Block until a complete frame is received
  /// @param frame populated with the received frame
  /// @return error_code, transport_read on any failure including orderly close
  virtual error_code read(Frame &frame) noexcept = 0;

  /// @brief Write a binary (PCM) frame, serialized with other writers
  /// @param pcm little endian 16-bit samples
  /// @return error_code, send_failure when the write fails
  virtual error_code write_binary(std::span<const uint8_t> pcm) noexcept = 0;

  /// @brief Close the channel, unblocking any pending read.  Idempotent.
  virtual void close() noexcept = 0;
};

} // namespace voice
} // namespace parley
