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

#include "codec/g711.hpp"

namespace parley {
namespace codec {

// μ-law
static constexpr int ULAW_BIAS{0x84};
static constexpr int ULAW_CLIP{32635};

// A-law segment end points (13-bit magnitude)
static constexpr int ALAW_SEG_END[8]{0x1F, 0x3F, 0x7F, 0xFF, 0x1FF, 0x3FF, 0x7FF, 0xFFF};

uint8_t g711::ulaw_encode(int16_t pcm) noexcept {
  int s = pcm;
  const int sign = (s < 0) ? 0x80 : 0x00;

  if (sign) s = -s;
  if (s > ULAW_CLIP) s = ULAW_CLIP;

  s += ULAW_BIAS;

  int exponent = 7;
  for (int mask = 0x4000; ((s & mask) == 0) && (exponent > 0); exponent--, mask >>= 1)
    ;

  const int mantissa = (s >> (exponent + 3)) & 0x0F;

  return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

int16_t g711::ulaw_decode(uint8_t u) noexcept {
  u = ~u;

  const int exponent = (u >> 4) & 0x07;
  const int mantissa = u & 0x0F;
  const int sample = (((mantissa << 3) + ULAW_BIAS) << exponent) - ULAW_BIAS;

  return static_cast<int16_t>((u & 0x80) ? -sample : sample);
}

uint8_t g711::alaw_encode(int16_t pcm) noexcept {
  int pcm_val = pcm >> 3; // 13-bit
  int mask;

  if (pcm_val >= 0) {
    mask = 0xD5; // sign (7th) bit = 1
  } else {
    mask = 0x55; // sign bit = 0
    pcm_val = -pcm_val - 1;
  }

  int seg = 0;
  while ((seg < 8) && (pcm_val > ALAW_SEG_END[seg])) seg++;

  // out of range, return maximum value
  if (seg >= 8) return static_cast<uint8_t>(0x7F ^ mask);

  int aval = seg << 4;
  aval |= (seg < 2) ? ((pcm_val >> 1) & 0x0F) : ((pcm_val >> seg) & 0x0F);

  return static_cast<uint8_t>(aval ^ mask);
}

int16_t g711::alaw_decode(uint8_t a) noexcept {
  a ^= 0x55;

  int t = (a & 0x0F) << 4;
  const int seg = (a & 0x70) >> 4;

  switch (seg) {
  case 0:
    t += 8;
    break;
  case 1:
    t += 0x108;
    break;
  default:
    t += 0x108;
    t <<= seg - 1;
  }

  return static_cast<int16_t>((a & 0x80) ? t : -t);
}

uint8v g711::decode(Codec c, std::span<const uint8_t> payload) noexcept {
  uint8v pcm;
  pcm.reserve(payload.size() * 2);

  for (const auto byte : payload) {
    const auto sample = static_cast<uint16_t>((c == Codec::PCMA) ? alaw_decode(byte)  //
                                                                 : ulaw_decode(byte)); //
    pcm.push_back(static_cast<uint8_t>(sample & 0xFF));
    pcm.push_back(static_cast<uint8_t>(sample >> 8));
  }

  return pcm;
}

uint8v g711::encode(Codec c, std::span<const uint8_t> pcm) noexcept {
  const auto samples = pcm.size() / 2;

  uint8v encoded;
  encoded.reserve(samples);

  for (size_t i = 0; i < samples; i++) {
    const auto sample = static_cast<int16_t>(pcm[i * 2] | (pcm[i * 2 + 1] << 8));

    encoded.push_back((c == Codec::PCMA) ? alaw_encode(sample) : ulaw_encode(sample));
  }

  return encoded;
}

} // namespace codec
} // namespace parley
