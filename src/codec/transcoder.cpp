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

#include "codec/transcoder.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "codec/g711.hpp"

namespace parley {
namespace codec {

void Transcoder::resolve(Codec c) noexcept {
  if (is_waveform(c)) {
    decoder.emplace<Waveform>();
  } else {
    decoder.emplace<Stateful>(std::make_unique<Av>(sample_rate));
  }

  INFO("resolve", "codec={} stateful={}", c, stateful());
}

error_code Transcoder::decode(Codec c, std::span<const uint8_t> payload, uint8v &pcm) noexcept {
  if (c == Codec::None) return make_error_code(err::unsupported_codec);

  // resolved once per stream, a stream that switches codec class
  // (e.g. PCMU to Opus) resolves again
  if (!resolved() || (stateful() == is_waveform(c))) resolve(c);

  pcm.clear();

  return std::visit(
      overloaded{[](std::monostate) { return make_error_code(err::unsupported_codec); },
                 [&](Waveform) {
                   pcm = g711::decode(c, payload);
                   return error_code();
                 },
                 [&](Stateful &av) {
                   if (!av || !av->ready()) return make_error_code(err::decode_failed);

                   return av->decode(payload, pcm);
                 }},
      decoder);
}

} // namespace codec
} // namespace parley
