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
#include "codec/libav.hpp"

#include <span>

namespace parley {
namespace codec {

/// @brief Persistent libavcodec Opus decoder for a single inbound stream.
///        Carries prediction state across packets and converts decoded
///        audio to mono s16 at the session sample rate.
class Av {

  static constexpr int OPUS_RATE{48000};
  static constexpr int OPUS_CHANNELS{2};

public:
  Av(int sample_rate) noexcept;
  ~Av() noexcept;

  Av(const Av &) = delete;
  Av &operator=(const Av &) = delete;

  /// @brief Decode one Opus packet
  /// @param payload rtp payload
  /// @param pcm appended with little endian s16 mono samples
  /// @return error_code, decode_failed when libavcodec rejects the packet
  error_code decode(std::span<const uint8_t> payload, uint8v &pcm) noexcept;

  bool ready() const noexcept { return codec_ctx != nullptr; }

private:
  error_code convert(AVFrame *frame, uint8v &pcm) noexcept;
  static string av_err(int rc) noexcept;

private:
  // order dependent
  const int sample_rate;

  // order independent
  const AVCodec *codec{nullptr};
  AVCodecContext *codec_ctx{nullptr};
  SwrContext *swr_ctx{nullptr};
  AVPacket *pkt{nullptr};
  AVFrame *audio_frame{nullptr};

public:
  MOD_ID("codec.av");
};

} // namespace codec
} // namespace parley
