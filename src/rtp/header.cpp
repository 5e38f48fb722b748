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

#include "rtp/header.hpp"
#include "base/error.hpp"

namespace parley {
namespace rtp {

static uint32_t be32(std::span<const uint8_t> s, size_t offset) noexcept {
  return (uint32_t(s[offset]) << 24) | (uint32_t(s[offset + 1]) << 16) |
         (uint32_t(s[offset + 2]) << 8) | uint32_t(s[offset + 3]);
}

error_code Header::parse(std::span<const uint8_t> packet, Header &hdr,
                         std::span<const uint8_t> &payload) noexcept {
  if (packet.size() < size()) return make_error_code(err::bad_packet);

  hdr.version = (packet[0] & 0xc0) >> 6;
  hdr.padding = packet[0] & 0x20;
  hdr.extension = packet[0] & 0x10;
  hdr.csrc_count = packet[0] & 0x0f;
  hdr.marker = packet[1] & 0x80;
  hdr.payload_type = packet[1] & 0x7f;
  hdr.seq_num = static_cast<seq_num_t>((packet[2] << 8) | packet[3]);
  hdr.timestamp = be32(packet, 4);
  hdr.ssrc = be32(packet, 8);

  if (!hdr.isValid()) return make_error_code(err::bad_packet);

  size_t offset = size() + (hdr.csrc_count * 4);
  if (offset > packet.size()) return make_error_code(err::bad_packet);

  if (hdr.extension) {
    // 16-bit profile, 16-bit length (in 32-bit words)
    if ((offset + 4) > packet.size()) return make_error_code(err::bad_packet);

    const size_t ext_words = (packet[offset + 2] << 8) | packet[offset + 3];
    offset += 4 + (ext_words * 4);

    if (offset > packet.size()) return make_error_code(err::bad_packet);
  }

  size_t end = packet.size();

  if (hdr.padding) {
    // last byte is the count of padding bytes, including itself
    const size_t pad = packet.back();

    if ((pad == 0) || ((offset + pad) > end)) return make_error_code(err::bad_packet);

    end -= pad;
  }

  payload = packet.subspan(offset, end - offset);

  return error_code();
}

void Header::marshal(uint8v &dest) const noexcept {
  dest.push_back(static_cast<uint8_t>((version << 6) | (padding ? 0x20 : 0x00) |
                                      (extension ? 0x10 : 0x00) | (csrc_count & 0x0f)));
  dest.push_back(static_cast<uint8_t>((marker ? 0x80 : 0x00) | (payload_type & 0x7f)));
  dest.append_be(seq_num);
  dest.append_be(timestamp);
  dest.append_be(ssrc);
}

} // namespace rtp
} // namespace parley
