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

#include "base/error.hpp"
#include "base/types.hpp"
#include "base/uint8v.hpp"
#include "bridge/observer.hpp"
#include "codec/ids.hpp"
#include "media/peer.hpp"
#include "rtp/sink.hpp"
#include "voice/channel.hpp"
#include "voice/connector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace parley {
namespace test {

struct CaptureSink : public rtp::Sink {
  error_code write(const uint8v &packet) noexcept override {
    std::scoped_lock lck(mtx);
    packets.push_back(packet);
    return error_code();
  }

  size_t count() const noexcept {
    std::scoped_lock lck(mtx);
    return packets.size();
  }

  mutable std::mutex mtx;
  std::vector<uint8v> packets;
};

/// @brief Channel that yields queued frames then blocks until closed
class FakeChannel : public voice::Channel {
public:
  error_code dial(const string &url) noexcept override {
    std::scoped_lock lck(mtx);
    dialed = url;

    return dial_fails ? errc::make_error_code(errc::connection_refused) : error_code();
  }

  error_code read(Frame &frame) noexcept override {
    std::unique_lock lck(mtx);

    cv.wait(lck, [this]() { return closed || !frames.empty() || end_when_drained; });

    if (closed || frames.empty()) return make_error_code(err::transport_read);

    frame = std::move(frames.front());
    frames.pop_front();

    return error_code();
  }

  error_code write_binary(std::span<const uint8_t> pcm) noexcept override {
    std::scoped_lock lck(mtx);
    written.emplace_back(pcm);

    return error_code();
  }

  void close() noexcept override {
    std::scoped_lock lck(mtx);
    closed = true;
    cv.notify_all();
  }

  void push_text(csv text) {
    std::scoped_lock lck(mtx);
    frames.push_back(Frame{.kind = Frame::Text, .payload = uint8v(text)});
    cv.notify_all();
  }

  void push_binary(const uint8v &pcm) {
    std::scoped_lock lck(mtx);
    frames.push_back(Frame{.kind = Frame::Binary, .payload = pcm});
    cv.notify_all();
  }

  bool is_closed() const {
    std::scoped_lock lck(mtx);
    return closed;
  }

  mutable std::mutex mtx;
  std::condition_variable cv;
  std::deque<Frame> frames;
  std::vector<uint8v> written;
  string dialed;
  bool dial_fails{false};
  bool end_when_drained{false};
  bool closed{false};
};

/// @brief Connector handing out one shared FakeChannel
class FakeConnector : public voice::Connector {
public:
  FakeConnector() : channel(std::make_shared<FakeChannel>()) {}

  error_code create_call(voice::Call &call, std::stop_token stoken) noexcept override {
    calls++;

    if (hold_create) {
      // until released or, unless ignored, a stop request
      std::unique_lock lck(hold_mtx);
      hold_cv.wait(lck, ignore_stop ? std::stop_token() : stoken, [this]() { return released; });

      return make_error_code(err::call_create_failed);
    }

    if (create_fails) return make_error_code(err::call_create_failed);

    call.call_id = "call-1";
    call.join_url = "wss://voice.example/join/1";

    return error_code();
  }

  std::unique_ptr<voice::Channel> make_channel() noexcept override {
    return std::make_unique<Handle>(channel);
  }

  // forwards to the shared channel so tests keep a view of it
  struct Handle : public voice::Channel {
    explicit Handle(std::shared_ptr<FakeChannel> ch) : ch(std::move(ch)) {}

    error_code dial(const string &url) noexcept override { return ch->dial(url); }
    error_code read(Frame &frame) noexcept override { return ch->read(frame); }
    error_code write_binary(std::span<const uint8_t> pcm) noexcept override {
      return ch->write_binary(pcm);
    }
    void close() noexcept override { ch->close(); }

    std::shared_ptr<FakeChannel> ch;
  };

  std::shared_ptr<FakeChannel> channel;
  std::atomic<int> calls{0};
  bool create_fails{false};
  bool hold_create{false};
  bool ignore_stop{false};

  void release() {
    {
      std::scoped_lock lck(hold_mtx);
      released = true;
    }

    hold_cv.notify_all();
  }

  std::mutex hold_mtx;
  std::condition_variable_any hold_cv;
  bool released{false};
};

struct FakeObserver : public bridge::Observer {
  error_code mirror(csv text) noexcept override {
    std::scoped_lock lck(mtx);
    mirrored.emplace_back(text);

    return error_code();
  }

  std::mutex mtx;
  std::vector<string> mirrored;
};

/// @brief Peer driven by the test: state changes and packets are injected
class FakePeer : public media::Peer {
public:
  struct PeerHooks {
    std::mutex mtx;
    state_handler state_h;
    packet_handler packet_h;
    bool negotiate_fails{false};
    int closes{0};
    std::shared_ptr<CaptureSink> sink{std::make_shared<CaptureSink>()};

    void state(media::PeerState s) {
      state_handler h;
      {
        std::scoped_lock lck(mtx);
        h = state_h;
      }

      if (h) h(s);
    }

    void packet(std::span<const uint8_t> p) {
      packet_handler h;
      {
        std::scoped_lock lck(mtx);
        h = packet_h;
      }

      if (h) h(p);
    }
  };

  explicit FakePeer(std::shared_ptr<PeerHooks> hooks) : hooks(std::move(hooks)) {}

  error_code negotiate(const string &offer_sdp, string &answer_sdp) noexcept override {
    if (hooks->negotiate_fails) return make_error_code(err::negotiation_failed);

    answer_sdp = fmt::format("answer-to:{}", offer_sdp);
    return error_code();
  }

  void on_state(state_handler h) noexcept override {
    std::scoped_lock lck(hooks->mtx);
    hooks->state_h = std::move(h);
  }

  void on_packet(packet_handler h) noexcept override {
    std::scoped_lock lck(hooks->mtx);
    hooks->packet_h = std::move(h);
  }

  codec::PayloadMap payload_map() const noexcept override { return codec::PayloadMap(); }

  std::shared_ptr<rtp::Sink> outbound() noexcept override { return hooks->sink; }

  void close() noexcept override {
    std::scoped_lock lck(hooks->mtx);
    hooks->closes++;
    hooks->state_h = nullptr;
    hooks->packet_h = nullptr;
  }

  std::shared_ptr<PeerHooks> hooks;
};

/// @brief Poll until pred is true or the timeout expires
template <typename P> bool eventually(P pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto until = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < until) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }

  return pred();
}

} // namespace test
} // namespace parley
