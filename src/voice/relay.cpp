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

#include "voice/relay.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "base/stats.hpp"
#include "base/threads.hpp"
#include "voice/control_event.hpp"

namespace parley {
namespace voice {

void Relay::start() noexcept {
  thread = std::jthread([this](std::stop_token stoken) {
    name_thread("voice_relay");
    run(stoken);
  });
}

void Relay::stop() noexcept {
  if (thread.joinable()) {
    thread.request_stop();
    thread.join();
  }
}

void Relay::run(std::stop_token stoken) noexcept {
  INFO_AUTO_CAT("run");

  const auto closed = [this](csv reason) {
    st.store(Closed);
    INFO("closed", "session={} {}", session->id(), reason);
  };

  Call call;
  if (auto ec = connector.create_call(call, stoken); ec) return closed(ec.message());

  std::shared_ptr<Channel> ch = connector.make_channel();

  // registered before dialing, invoked at once when stop is already requested
  std::stop_callback stop_cb(stoken, [ch]() { ch->close(); });

  if (stoken.stop_requested()) return closed("stop requested");

  if (auto ec = ch->dial(call.join_url); ec) {
    ch->close();
    return closed(fmt::format("dial failed, {}", ec));
  }

  session->attach_channel(ch);
  st.store(Connected);
  INFO_AUTO("session={} call={} connected", session->id(), call.call_id);

  Channel::Frame frame;

  while (!stoken.stop_requested()) {
    if (auto ec = ch->read(frame); ec) break;

    if (frame.binary()) {
      frames++;

      // a failed send is counted by the packetizer, the loop continues
      if (auto ec = session->outbound().send(frame.payload); ec) {
        INFO_AUTO("outbound send failed, {}", ec);
      }
    } else {
      control(frame.payload.view());
    }
  }

  session->detach_channel();
  ch->close();

  closed(fmt::format("frames={} control={} dropped={}", frames.load(), msgs.load(),
                     dropped.load()));
}

void Relay::control(csv text) noexcept {
  INFO_AUTO_CAT("control");

  ControlEvent ev;

  if (auto ec = ControlEvent::parse(text, ev); ec) {
    dropped++;
    Stats::write(stats::CONTROL_DROPPED, 1);
    INFO_AUTO("dropped, {} text={}", ec, text);
    return;
  }

  msgs++;
  Stats::write(stats::CONTROL_MSGS, 1);

  // mirrored verbatim, before local handling
  if (auto obs = registry.observer(); obs) {
    if (auto ec = obs->mirror(text); ec) INFO_AUTO("mirror failed, {}", ec);
  }

  std::visit(overloaded{[](const ControlEvent::Transcript &t) {
                          if (t.final) INFO("transcript", "{}: {}", t.role, t.text);
                        },
                        [](const ControlEvent::Error &e) { INFO("error", "{}", e.error); },
                        [](const ControlEvent::State &s) { INFO("state", "{}", s.state); },
                        [&](const ControlEvent::Unknown &u) {
                          INFO("unknown", "type={} {}", ev.kind, u.raw);
                        }},
             ev.event);
}

} // namespace voice
} // namespace parley
