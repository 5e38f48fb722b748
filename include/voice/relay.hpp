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
#include "bridge/registry.hpp"
#include "bridge/session.hpp"
#include "voice/channel.hpp"
#include "voice/connector.hpp"

#include <atomic>
#include <fmt/format.h>
#include <memory>
#include <stop_token>
#include <thread>

namespace parley {
namespace voice {

/// @brief Joins a voice call for a session and moves its frames: binary
///        frames to the session's outbound packetizer, text frames to
///        the observer and the log.  Dialing -> Connected -> Closed,
///        Closed is terminal.
class Relay {
public:
  enum State : uint8_t { Dialing = 0, Connected, Closed };

public:
  Relay(std::shared_ptr<bridge::Session> session, bridge::Registry &registry,
        Connector &connector) noexcept
      : session(std::move(session)), registry(registry), connector(connector) {}

  ~Relay() noexcept { stop(); }

  Relay(const Relay &) = delete;
  Relay &operator=(const Relay &) = delete;

  /// @brief Run the relay on its own thread
  void start() noexcept;

  /// @brief Request stop (closes the channel) without waiting for the thread
  void request_stop() noexcept { thread.request_stop(); }

  /// @brief Request stop and join the thread.  Idempotent.
  void stop() noexcept;

  /// @brief Create the call, dial it and read until the channel fails or
  ///        stop is requested.  Runs on the relay thread.
  /// @param stoken stop token, a stop request closes the channel
  void run(std::stop_token stoken) noexcept;

  /// @brief Handle one text frame
  /// @param text frame payload
  void control(csv text) noexcept;

  State state() const noexcept { return st.load(); }
  const auto &owner() const noexcept { return session; }

  uint64_t control_msgs() const noexcept { return msgs.load(); }
  uint64_t control_dropped() const noexcept { return dropped.load(); }
  uint64_t pcm_frames() const noexcept { return frames.load(); }

private:
  // order dependent
  std::shared_ptr<bridge::Session> session;
  bridge::Registry &registry;
  Connector &connector;

  // order independent
  std::atomic<State> st{Dialing};
  std::atomic<uint64_t> msgs{0};
  std::atomic<uint64_t> dropped{0};
  std::atomic<uint64_t> frames{0};
  std::jthread thread;

public:
  MOD_ID("voice.relay");
};

} // namespace voice
} // namespace parley

template <> struct fmt::formatter<parley::voice::Relay::State> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const parley::voice::Relay::State &st, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    static constexpr std::string_view names[]{"dialing", "connected", "closed"};
    return formatter<std::string>::format(std::string(names[st]), ctx);
  }
};
