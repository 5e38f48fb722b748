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

#include "base/types.hpp"

#include <cstdint>
#include <fmt/format.h>
#include <map>

namespace parley {
namespace codec {

/// @brief Codecs accepted from the browser (inbound) and the subset
///        usable for the fixed outbound direction (PCMU, PCMA)
enum class Codec : uint8_t { None = 0, PCMU, PCMA, Opus };

/// @brief RFC 3551 static payload types
static constexpr uint8_t PT_PCMU{0};
static constexpr uint8_t PT_PCMA{8};

/// @brief Codec name as it appears in an SDP rtpmap (e.g. PCMU/8000)
/// @param c codec
/// @return constant string view
csv name(Codec c) noexcept;

/// @brief Codec for an rtpmap encoding name (case insensitive)
/// @param encoding encoding name (e.g. "opus", "PCMA")
/// @return codec or Codec::None when not one of the accepted set
Codec from_name(csv encoding) noexcept;

/// @brief Is the codec a stateless waveform (G.711) codec
inline constexpr bool is_waveform(Codec c) noexcept {
  return (c == Codec::PCMU) || (c == Codec::PCMA);
}

/// @brief Static payload type of a waveform codec
inline constexpr uint8_t static_pt(Codec c) noexcept {
  return (c == Codec::PCMA) ? PT_PCMA : PT_PCMU;
}

/// @brief Negotiated payload type to codec map.  The static G.711
///        payload types are always present, dynamic entries (e.g. Opus)
///        come from the negotiated description.
class PayloadMap {
public:
  PayloadMap() noexcept {
    map.emplace(PT_PCMU, Codec::PCMU);
    map.emplace(PT_PCMA, Codec::PCMA);
  }

  void add(uint8_t pt, Codec c) noexcept { map.insert_or_assign(pt, c); }

  /// @brief Codec negotiated for the payload type
  /// @param pt payload type (marker bit excluded)
  /// @return codec or Codec::None when the payload type was not negotiated
  Codec lookup(uint8_t pt) const noexcept {
    auto it = map.find(pt);

    return (it != map.end()) ? it->second : Codec::None;
  }

  auto size() const noexcept { return map.size(); }

private:
  std::map<uint8_t, Codec> map;
};

} // namespace codec
} // namespace parley

template <> struct fmt::formatter<parley::codec::Codec> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(parley::codec::Codec c, FormatContext &ctx) const -> decltype(ctx.out()) {
    return formatter<std::string_view>::format(parley::codec::name(c), ctx);
  }
};
