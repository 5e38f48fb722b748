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

#include <cstdint>
#include <fmt/format.h>
#include <span>

namespace parley {
namespace rtp {

struct Header {
  /*
  RFC3550 fixed header
       0                   1                   2                   3
       0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
       ---------------------------------------------------------------
 0x0  | V |P|X|  CC   |M|     PT      |       Sequence Number         |
      |---------------------------------------------------------------|
 0x4  |                           Timestamp                           |
      |---------------------------------------------------------------|
 0x8  |                             SSRC                              |
      |---------------------------------------------------------------|
 0xc  :                 CSRC list (CC * 4 bytes)                      :
      :          extension (X: 4 byte header + length * 4 bytes)      :

  */

  uint8_t version{2};
  bool padding{false};
  bool extension{false};
  uint8_t csrc_count{0};
  bool marker{false};
  uint8_t payload_type{0};
  seq_num_t seq_num{0};
  rtp_ts_t timestamp{0};
  ssrc_t ssrc{0};

  static constexpr size_t size() { return 12; }

  bool isValid() const noexcept { return version == 0x02; }

  /// @brief Is the buffer an RTCP packet multiplexed on the rtp transport
  ///        (RFC 5761: payload type 64-95 once the marker bit is masked)
  /// @param packet received bytes
  /// @return boolean
  static bool is_rtcp(std::span<const uint8_t> packet) noexcept {
    if (packet.size() < 2) return false;

    const uint8_t pt = packet[1] & 0x7f;
    return (pt >= 64) && (pt <= 95);
  }

  /// @brief Parse a received packet.  The payload excludes the CSRC list,
  ///        header extension and any padding.
  /// @param packet received bytes
  /// @param hdr populated header
  /// @param payload populated payload view into packet
  /// @return error_code, bad_packet when the packet is short, has a
  ///         version other than 2 or inconsistent lengths
  static error_code parse(std::span<const uint8_t> packet, Header &hdr,
                          std::span<const uint8_t> &payload) noexcept;

  /// @brief Append the fixed 12 byte header (no CSRC list or extension)
  /// @param dest destination container
  void marshal(uint8v &dest) const noexcept;
};

} // namespace rtp
} // namespace parley

template <> struct fmt::formatter<parley::rtp::Header> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const parley::rtp::Header &h, FormatContext &ctx) const -> decltype(ctx.out()) {
    return formatter<std::string>::format(fmt::format("pt={} seq={} ts={} ssrc={:#x}{}",
                                                      h.payload_type, h.seq_num, h.timestamp,
                                                      h.ssrc, h.marker ? " M" : ""),
                                          ctx);
  }
};
