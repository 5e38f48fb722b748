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
#include "base/uint8v.hpp"
#include "codec/ids.hpp"

#include <cstdint>
#include <span>

namespace parley {
namespace codec {

/// @brief ITU-T G.711 companding (μ-law and A-law)
struct g711 {
  static uint8_t ulaw_encode(int16_t pcm) noexcept;
  static int16_t ulaw_decode(uint8_t u) noexcept;

  static uint8_t alaw_encode(int16_t pcm) noexcept;
  static int16_t alaw_decode(uint8_t a) noexcept;

  /// @brief Expand companded bytes to little endian 16-bit PCM
  /// @param c PCMU or PCMA
  /// @param payload companded bytes, one per sample
  /// @return PCM, two bytes per sample
  static uint8v decode(Codec c, std::span<const uint8_t> payload) noexcept;

  /// @brief Compand little endian 16-bit PCM.  A trailing odd byte is ignored.
  /// @param c PCMU or PCMA
  /// @param pcm little endian samples
  /// @return companded bytes, one per sample
  static uint8v encode(Codec c, std::span<const uint8_t> pcm) noexcept;
};

} // namespace codec
} // namespace parley
