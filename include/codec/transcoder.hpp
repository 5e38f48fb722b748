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
#include "codec/av.hpp"
#include "codec/ids.hpp"

#include <memory>
#include <span>
#include <variant>

namespace parley {
namespace codec {

/// @brief Inbound (browser to voice session) transcoder for one stream.
///        Produces little endian 16-bit mono PCM at the session sample rate.
class Transcoder {
public:
  /// @brief Stateless per-sample companding (PCMU, PCMA)
  struct Waveform {};

  /// @brief Persistent decoder carrying state across packets (Opus)
  using Stateful = std::unique_ptr<Av>;

  /// @brief Resolved decoder for the stream
  using decoder_v = std::variant<std::monostate, Waveform, Stateful>;

public:
  explicit Transcoder(int sample_rate) noexcept : sample_rate(sample_rate) {}

  /// @brief Decode a packet payload
  /// @param c negotiated codec of the packet (from its payload type)
  /// @param payload packet payload
  /// @param pcm receives the decoded PCM (replaced, not appended)
  /// @return error_code, unsupported_codec for a codec outside the
  ///         negotiated set, decode_failed when the stateful decoder fails
  error_code decode(Codec c, std::span<const uint8_t> payload, uint8v &pcm) noexcept;

  /// @brief Has a decoder been resolved for this stream
  bool resolved() const noexcept { return !std::holds_alternative<std::monostate>(decoder); }

  /// @brief Is the resolved decoder stateful
  bool stateful() const noexcept { return std::holds_alternative<Stateful>(decoder); }

private:
  void resolve(Codec c) noexcept;

private:
  // order dependent
  const int sample_rate;

  // order independent
  decoder_v decoder;

public:
  MOD_ID("codec.transcoder");
};

} // namespace codec
} // namespace parley
