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
#include "base/conf/token.hpp"
#include "base/dura_t.hpp"
#include "base/types.hpp"
#include "codec/ids.hpp"
#include "media/peer.hpp"
#include "rtp/sink.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <rtc/rtc.hpp>
#include <vector>

namespace parley {
namespace media {

/// @brief Peer implemented with libdatachannel: one sendrecv audio track
///        answering a browser offer
class RtcPeer : public Peer {
public:
  struct Opts {
    std::vector<string> ice_servers;
    codec::Codec outbound{codec::Codec::PCMU};
    ssrc_t ssrc{12345};
    Millis gathering_timeout{30s};
  };

private:
  /// @brief Writes marshaled packets to the audio track
  class TrackSink : public rtp::Sink {
  public:
    TrackSink(std::shared_ptr<rtc::Track> track) noexcept : track(std::move(track)) {}

    error_code write(const uint8v &packet) noexcept override;

  private:
    std::shared_ptr<rtc::Track> track;
  };

public:
  RtcPeer(const Opts &opts) noexcept : opts(opts) {}
  ~RtcPeer() noexcept { close(); }

  error_code negotiate(const string &offer_sdp, string &answer_sdp) noexcept override;

  void on_state(state_handler h) noexcept override { state_h = std::move(h); }
  void on_packet(packet_handler h) noexcept override { packet_h = std::move(h); }

  codec::PayloadMap payload_map() const noexcept override {
    std::scoped_lock lck(mtx);
    return pt_map;
  }

  std::shared_ptr<rtp::Sink> outbound() noexcept override {
    std::scoped_lock lck(mtx);
    return sink;
  }

  void close() noexcept override;

  /// @brief Route libdatachannel logging through Logger
  static void init_logger() noexcept;

  /// @brief Options from the [media] table
  static Opts make_opts(const conf::token &tokc) noexcept;

  /// @brief Factory creating a RtcPeer per offer, options are captured once
  static PeerFactory factory(const conf::token &tokc) noexcept;

private:
  void attach_receiver(std::shared_ptr<rtc::Track> t) noexcept;
  error_code failed(csv reason) noexcept;
  static PeerState map_state(rtc::PeerConnection::State s) noexcept;

private:
  // order dependent
  const Opts opts;

  // order independent
  mutable std::mutex mtx;
  std::condition_variable gathered_cv;
  bool gathered{false};
  std::shared_ptr<rtc::PeerConnection> pc;
  std::shared_ptr<rtc::Track> track;
  std::shared_ptr<TrackSink> sink;
  codec::PayloadMap pt_map;
  state_handler state_h;
  packet_handler packet_h;
  std::atomic_flag closed;

public:
  MOD_ID("media.rtc_peer");
};

} // namespace media
} // namespace parley
