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
#include "base/uuid.hpp"
#include "codec/ids.hpp"
#include "rtp/packetizer.hpp"
#include "rtp/sink.hpp"
#include "voice/channel.hpp"

#include <atomic>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <span>
#include <utility>

namespace parley {
namespace bridge {

/// @brief One active pairing of a media connection and a voice session
///        connection.  Owns the outbound packetizer (and therefore its
///        counters) and the voice channel once the relay has dialed.
class Session : public std::enable_shared_from_this<Session> {
public:
  enum State : uint8_t { Negotiating = 0, Connected, Closed };

  struct Opts {
    codec::Codec outbound{codec::Codec::PCMU};
    ssrc_t ssrc{12345};
    int sample_rate{8000};
  };

private:
  Session(const Opts &opts, std::shared_ptr<rtp::Sink> sink) noexcept
      : opts(opts), packetizer(opts.outbound, opts.ssrc, std::move(sink)) {}

public:
  static std::shared_ptr<Session> create(const Opts &opts,
                                         std::shared_ptr<rtp::Sink> sink) noexcept {
    return std::shared_ptr<Session>(new Session(opts, std::move(sink)));
  }

  const UUID &id() const noexcept { return uuid; }

  /// @brief Forward inbound PCM to the voice channel, best effort.
  ///        Silently dropped when no channel is attached.
  /// @param pcm little endian 16-bit samples
  /// @return true when written
  bool forward(std::span<const uint8_t> pcm) noexcept;

  void attach_channel(std::shared_ptr<voice::Channel> ch) noexcept {
    std::scoped_lock lck(mtx);
    channel = std::move(ch);
  }

  std::shared_ptr<voice::Channel> detach_channel() noexcept {
    std::scoped_lock lck(mtx);
    return std::exchange(channel, nullptr);
  }

  bool has_channel() const noexcept {
    std::scoped_lock lck(mtx);
    return (bool)channel;
  }

  rtp::Packetizer &outbound() noexcept { return packetizer; }
  const Opts &options() const noexcept { return opts; }

  State state() const noexcept { return st.load(); }
  void state(State next) noexcept { st.store(next); }

  /// @brief Inbound codec as negotiated (informational, set on first packet)
  codec::Codec inbound() const noexcept { return inbound_codec.load(); }
  void inbound(codec::Codec c) noexcept { inbound_codec.store(c); }

private:
  // order dependent
  const Opts opts;
  rtp::Packetizer packetizer;

  // order independent
  const UUID uuid;
  std::atomic<State> st{Negotiating};
  std::atomic<codec::Codec> inbound_codec{codec::Codec::None};
  mutable std::mutex mtx;
  std::shared_ptr<voice::Channel> channel;

public:
  MOD_ID("bridge.session");
};

} // namespace bridge
} // namespace parley

template <> struct fmt::formatter<parley::bridge::Session> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const parley::bridge::Session &s, FormatContext &ctx) const -> decltype(ctx.out()) {
    static constexpr std::string_view states[]{"negotiating", "connected", "closed"};

    return formatter<std::string>::format(
        fmt::format("{} {} out={} ssrc={}", s.id(), states[s.state()], s.options().outbound,
                    s.options().ssrc),
        ctx);
  }
};
