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

#include "media/rtc_peer.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <algorithm>
#include <utility>
#include <variant>

namespace parley {
namespace media {

error_code RtcPeer::TrackSink::write(const uint8v &packet) noexcept {
  try {
    if (!track || !track->isOpen()) return make_error_code(err::send_failure);

    if (!track->send(reinterpret_cast<const rtc::byte *>(packet.data()), packet.size())) {
      return make_error_code(err::send_failure);
    }

  } catch (const std::exception &) {
    return make_error_code(err::send_failure);
  }

  return error_code();
}

void RtcPeer::attach_receiver(std::shared_ptr<rtc::Track> t) noexcept {
  if (!t) return;

  t->onMessage(
      [this](rtc::binary msg) {
        if (packet_h) {
          packet_h(std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(msg.data()),
                                            msg.size()));
        }
      },
      nullptr);
}

void RtcPeer::close() noexcept {
  if (closed.test_and_set()) return;

  std::shared_ptr<rtc::PeerConnection> pc_local;
  std::shared_ptr<rtc::Track> track_local;

  {
    std::scoped_lock lck(mtx);
    pc_local = std::exchange(pc, nullptr);
    track_local = std::exchange(track, nullptr);
  }

  try {
    if (track_local) track_local->resetCallbacks();

    if (pc_local) {
      pc_local->resetCallbacks();
      pc_local->close();
    }
  } catch (const std::exception &e) {
    INFO("close", "exception {}", e.what());
  }
}

error_code RtcPeer::failed(csv reason) noexcept {
  INFO("negotiate", "failed, {}", reason);

  return make_error_code(err::negotiation_failed);
}

void RtcPeer::init_logger() noexcept {
  rtc::InitLogger(rtc::LogLevel::Warning, [](rtc::LogLevel, rtc::string message) {
    INFO("rtc", "{}", message);
  });
}

RtcPeer::Opts RtcPeer::make_opts(const conf::token &tokc) noexcept {
  Opts opts;

  opts.ice_servers = tokc.strings("ice_servers");
  if (!tokc.table().contains("ice_servers")) {
    opts.ice_servers.emplace_back("stun:stun.l.google.com:19302");
  }

  if (const auto c = codec::from_name(tokc.val("outbound_codec", "PCMU")); codec::is_waveform(c)) {
    opts.outbound = c;
  }

  opts.ssrc = tokc.val<ssrc_t>("ssrc", opts.ssrc);
  opts.gathering_timeout = tokc.timeout_val("gathering_timeout", opts.gathering_timeout);

  return opts;
}

PeerFactory RtcPeer::factory(const conf::token &tokc) noexcept {
  return [opts = make_opts(tokc)]() -> std::unique_ptr<Peer> {
    return std::make_unique<RtcPeer>(opts);
  };
}

PeerState RtcPeer::map_state(rtc::PeerConnection::State s) noexcept {
  using State = rtc::PeerConnection::State;

  switch (s) {
  case State::New:
    return PeerState::New;
  case State::Connecting:
    return PeerState::Connecting;
  case State::Connected:
    return PeerState::Connected;
  case State::Disconnected:
    return PeerState::Disconnected;
  case State::Failed:
    return PeerState::Failed;
  case State::Closed:
    return PeerState::Closed;
  }

  return PeerState::Failed;
}

error_code RtcPeer::negotiate(const string &offer_sdp, string &answer_sdp) noexcept {
  INFO_AUTO_CAT("negotiate");

  try {
    rtc::Configuration cfg;
    for (const auto &url : opts.ice_servers) cfg.iceServers.emplace_back(url);
    cfg.disableAutoNegotiation = true;

    auto conn = std::make_shared<rtc::PeerConnection>(cfg);

    conn->onStateChange([this](rtc::PeerConnection::State s) {
      if (state_h) state_h(map_state(s));
    });

    conn->onGatheringStateChange([this](rtc::PeerConnection::GatheringState s) {
      if (s == rtc::PeerConnection::GatheringState::Complete) {
        std::scoped_lock lck(mtx);
        gathered = true;
        gathered_cv.notify_all();
      }
    });

    conn->onTrack([this](std::shared_ptr<rtc::Track> t) { attach_receiver(std::move(t)); });

    {
      std::scoped_lock lck(mtx);
      pc = conn;
    }

    rtc::Description offer(offer_sdp, rtc::Description::Type::Offer);

    rtc::Description::Media *remote = nullptr;
    for (int i = 0; (i < offer.mediaCount()) && !remote; i++) {
      auto media = offer.media(i);

      if (auto *m = std::get_if<rtc::Description::Media *>(&media); m) {
        if ((*m)->type() == "audio") remote = *m;
      }
    }

    if (!remote) return failed("no audio section in offer");

    // the negotiated set: PCMU, PCMA and Opus in any order the browser offered
    codec::PayloadMap negotiated;
    auto answer_media = remote->reciprocate();

    for (const auto pt : answer_media.payloadTypes()) {
      const auto c = codec::from_name(answer_media.rtpMap(pt)->format);

      if (c == codec::Codec::None) {
        answer_media.removeRtpMap(pt);
      } else {
        negotiated.add(static_cast<uint8_t>(pt), c);
      }
    }

    const auto outbound_pt = codec::static_pt(opts.outbound);
    const auto offered = remote->payloadTypes();

    if (std::find(offered.begin(), offered.end(), outbound_pt) == offered.end()) {
      return failed(fmt::format("outbound codec {} not offered", opts.outbound));
    }

    answer_media.setDirection(rtc::Description::Direction::SendRecv);
    answer_media.addSSRC(opts.ssrc, string(module_id));

    conn->setRemoteDescription(offer);

    auto audio_track = conn->addTrack(answer_media);
    attach_receiver(audio_track);

    {
      std::scoped_lock lck(mtx);
      pt_map = std::move(negotiated);
      track = audio_track;
      sink = std::make_shared<TrackSink>(audio_track);
    }

    conn->setLocalDescription(rtc::Description::Type::Answer);

    // the answer is returned whole, wait for candidate gathering
    std::unique_lock lck(mtx);
    if (!gathered_cv.wait_for(lck, opts.gathering_timeout, [this]() { return gathered; })) {
      lck.unlock();
      return failed("ice gathering timeout");
    }
    lck.unlock();

    auto local = conn->localDescription();
    if (!local.has_value()) return failed("no local description");

    answer_sdp = string(*local);

    INFO_AUTO("answer ready, payload types={} outbound={} ssrc={}", pt_map.size(), opts.outbound,
              opts.ssrc);

  } catch (const std::exception &e) {
    return failed(e.what());
  }

  return error_code();
}

} // namespace media
} // namespace parley
