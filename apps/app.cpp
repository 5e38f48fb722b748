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

#include "app.hpp"
#include "base/conf/fixed.hpp"
#include "base/conf/master.hpp"
#include "base/conf/token.hpp"
#include "base/logger.hpp"
#include "base/stats.hpp"
#include "base/threads.hpp"
#include "bridge/bridge.hpp"
#include "bridge/registry.hpp"
#include "media/rtc_peer.hpp"
#include "signal/server.hpp"
#include "voice/service.hpp"

#include <csignal>
#include <optional>

namespace parley {

App::App() noexcept : ss_shutdown(io_ctx, SIGINT, SIGTERM) {

  // set up our shutdown signal handler
  ss_shutdown.async_wait([this](const error_code &ec, int sig) {
    INFO_AUTO_CAT("ss_shutdown");

    if (ec) return;

    INFO_AUTO("caught signal({}), requesting stop...", sig);

    thread.request_stop();
  });
}

int App::main() {
  INFO_AUTO_CAT("main");

  Logger::create(io_ctx);

  if (const auto &msg = conf::mptr->get_msg(conf::master::InitMsg); !msg.empty()) {
    INFO("config", "{}", msg);
  }

  INFO_INIT("{} {} starting", conf::fixed::app_name(), conf::fixed::version());

  Stats::create(io_ctx);
  media::RtcPeer::init_logger();

  bridge::Registry registry;
  voice::Service voice_service;

  const conf::token media_tokc("media");

  bridge::Bridge bridge(io_ctx, registry, media::RtcPeer::factory(media_tokc), voice_service,
                        bridge::Bridge::session_opts(media_tokc));

  signal::Server server(io_ctx, conf::token("signal"),
                        signal::Routes{.offer =
                                           [&bridge](const string &offer, string &answer) {
                                             return bridge.offer(offer, answer);
                                           },
                                       .registry = &registry});

  if (!server.listening()) {
    INFO_AUTO("signaling server not listening, exiting");

    Logger::synchronous();

    error_code ec;
    if (ss_shutdown.cancel(ec); ec) INFO_AUTO("signal cancel {}", ec);

    bridge.shutdown();
    Stats::shutdown();
    Logger::shutdown();

    return EXIT_FAILURE;
  }

  thread = std::jthread([this](std::stop_token stoken) mutable {
    name_thread("parley_app");

    stop_request_watcher(std::move(stoken));

    io_ctx.run();
  });

  if (thread.joinable()) thread.join();

  // io_ctx no longer runs posted log writes
  Logger::synchronous();

  INFO_AUTO("primary io_ctx has finished all work");

  // stop accepting, then stop relays and close peers
  server.shutdown();
  bridge.shutdown();

  Stats::shutdown();
  Logger::shutdown();

  return EXIT_SUCCESS;
}

void App::stop_request_watcher(std::stop_token stoken) noexcept {

  auto sr_timer = std::make_unique<asio::system_timer>(io_ctx, 1s);

  sr_timer->expires_after(1s);
  sr_timer->async_wait([this, stoken = std::move(stoken),
                        sr_timer = std::move(sr_timer)](const error_code &ec) mutable {
    if (ec) return;

    if (stoken.stop_requested()) {
      asio::post(io_ctx, [this]() {
        INFO("stop_request", "detected");

        io_ctx.stop();
      });
    } else {
      stop_request_watcher(std::move(stoken));
    }
  });
}

} // namespace parley
