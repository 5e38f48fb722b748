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

#include "codec/av.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <algorithm>
#include <array>

namespace parley {
namespace codec {

Av::Av(int sample_rate) noexcept : sample_rate(sample_rate) {
  codec = avcodec_find_decoder(AV_CODEC_ID_OPUS);

  INFO_INIT("sample_rate={} codec={}", sample_rate, fmt::ptr(codec));

  if (codec) {
    codec_ctx = avcodec_alloc_context3(codec);

    if (codec_ctx) {
      codec_ctx->sample_rate = OPUS_RATE;
      av_channel_layout_default(&codec_ctx->ch_layout, OPUS_CHANNELS);

      if (auto rc = avcodec_open2(codec_ctx, codec, nullptr); rc < 0) {
        INFO("codec_open", "failed, {}", av_err(rc));
        avcodec_free_context(&codec_ctx);
      } else [[likely]] {
        pkt = av_packet_alloc();
        audio_frame = av_frame_alloc();
      }
    } // end codec ctx
  }
}

Av::~Av() noexcept {
  av_frame_free(&audio_frame);
  av_packet_free(&pkt);
  swr_free(&swr_ctx);
  avcodec_free_context(&codec_ctx);
}

string Av::av_err(int rc) noexcept {
  std::array<char, AV_ERROR_MAX_STRING_SIZE> buff{};
  av_strerror(rc, buff.data(), buff.size());

  return fmt::format("rc={} {}", rc, buff.data());
}

error_code Av::decode(std::span<const uint8_t> payload, uint8v &pcm) noexcept {
  if (!ready() || !pkt || !audio_frame || payload.empty()) return make_error_code(err::decode_failed);

  if (auto rc = av_new_packet(pkt, static_cast<int>(payload.size())); rc < 0) {
    INFO("send_packet", "alloc failed, {}", av_err(rc));
    return make_error_code(err::decode_failed);
  }

  std::copy(payload.begin(), payload.end(), pkt->data);

  auto rc = avcodec_send_packet(codec_ctx, pkt);
  av_packet_unref(pkt);

  if (rc < 0) {
    INFO("send_packet", "failed size={} {}", payload.size(), av_err(rc));
    return make_error_code(err::decode_failed);
  }

  error_code ec;

  while (!ec) {
    rc = avcodec_receive_frame(codec_ctx, audio_frame);

    if ((rc == AVERROR(EAGAIN)) || (rc == AVERROR_EOF)) break;

    if (rc < 0) {
      INFO("recv_frame", "failed {}", av_err(rc));
      ec = make_error_code(err::decode_failed);
    } else {
      ec = convert(audio_frame, pcm);
    }

    av_frame_unref(audio_frame);
  }

  return ec;
}

error_code Av::convert(AVFrame *frame, uint8v &pcm) noexcept {

  if (swr_ctx == nullptr) {
    AVChannelLayout mono;
    av_channel_layout_default(&mono, 1);

    auto rc = swr_alloc_set_opts2(&swr_ctx,                                // ctx
                                  &mono, AV_SAMPLE_FMT_S16, sample_rate,   // out
                                  &frame->ch_layout,                       // in layout
                                  static_cast<AVSampleFormat>(frame->format), // in format
                                  frame->sample_rate,                      // in rate
                                  0, nullptr);

    if ((rc < 0) || ((rc = swr_init(swr_ctx)) < 0)) {
      INFO("convert", "swr init failed, {}", av_err(rc));
      swr_free(&swr_ctx);
      return make_error_code(err::decode_failed);
    }

    INFO("convert", "in rate={} channels={} format={} out rate={}", frame->sample_rate,
         frame->ch_layout.nb_channels, frame->format, sample_rate);
  }

  const int out_max = swr_get_out_samples(swr_ctx, frame->nb_samples);
  if (out_max <= 0) return error_code();

  const auto offset = pcm.size();
  pcm.resize(offset + out_max * 2);

  uint8_t *out_planes[1] = {pcm.data() + offset};

  const int converted = swr_convert(swr_ctx, out_planes, out_max,             //
                                    (const uint8_t **)frame->extended_data, //
                                    frame->nb_samples);

  if (converted < 0) {
    pcm.resize(offset);
    INFO("convert", "swr_convert failed, {}", av_err(converted));
    return make_error_code(err::decode_failed);
  }

  pcm.resize(offset + converted * 2);

  return error_code();
}

} // namespace codec
} // namespace parley
