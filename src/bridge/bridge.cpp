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

#include "bridge/bridge.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "base/stats.hpp"
#include "base/threads.hpp"

#include <algorithm>

namespace parley {
namespace bridge {

Bridge::Bridge(asio::io_context &io_ctx, Registry &registry, media::PeerFactory peer_factory,
               voice::Connector &connector, const Session::Opts &opts) noexcept
    : io_ctx(io_ctx), registry(registry), peer_factory(std::move(peer_factory)),
      connector(connector), opts(opts) {
  reaper = std::jthread([this](std::stop_token stoken) {
    name_thread("bridge_reaper");
    reap(stoken);
  });
}

Session::Opts Bridge::session_opts(const conf::token &tokc) noexcept {
  Session::Opts o;

  if (const auto c = codec::from_name(tokc.val("outbound_codec", "PCMU")); codec::is_waveform(c)) {
    o.outbound = c;
  } else {
    INFO("config", "outbound_codec must be PCMU or PCMA, using {}", o.outbound);
  }

  o.ssrc = tokc.val<ssrc_t>("ssrc", o.ssrc);
  o.sample_rate = tokc.val<int>("sample_rate", o.sample_rate);

  return o;
}

error_code Bridge::offer(const string &offer_sdp, string &answer_sdp) noexcept {
  INFO_AUTO_CAT("offer");

  if (shutting_down.test()) return make_error_code(err::negotiation_failed);

  auto peer = peer_factory();
  auto inbound = std::make_shared<media::Inbound>(registry, opts.sample_rate);

  // drops are counted and logged by Inbound
  peer->on_packet([inbound](std::span<const uint8_t> packet) { inbound->handle(packet); });

  auto n = media::Negotiation::create(
      std::move(peer),
      media::Negotiation::Handlers{
          .on_connected = [this](std::shared_ptr<media::Negotiation> n) { connected(n); },
          .on_closed = [this](std::shared_ptr<media::Negotiation> n) { closed(n); }});

  {
    std::scoped_lock lck(mtx);
    entries.emplace_back(Entry{.negotiation = n, .inbound = inbound});
  }

  if (auto ec = n->accept(offer_sdp, answer_sdp); ec) {
    INFO_AUTO("negotiation={} failed, {}", n->id(), ec);

    closed(n);
    return ec;
  }

  inbound->payload_map(n->media_peer().payload_map());

  return error_code();
}

void Bridge::connected(std::shared_ptr<media::Negotiation> n) noexcept {
  INFO_AUTO_CAT("connected");

  if (shutting_down.test()) return;

  auto session = Session::create(opts, n->media_peer().outbound());

  std::scoped_lock lck(mtx);

  auto it = std::find_if(entries.begin(), entries.end(),
                         [&](const Entry &e) { return e.negotiation == n; });

  if (it == entries.end()) return;

  if (auto prev = registry.set_active(session); prev) {
    INFO_AUTO("session={} replaces {}", session->id(), prev->id());
  }

  session->state(Session::Connected);
  Stats::write(stats::SESSION_CREATED, 1);

  it->session = session;
  it->relay = std::make_unique<voice::Relay>(session, registry, connector);
  it->relay->start();

  INFO_AUTO("{}", *session);
}

void Bridge::closed(std::shared_ptr<media::Negotiation> n) noexcept {
  // the peer invokes this from its own thread, teardown closes that peer
  asio::post(io_ctx, [this, n]() {
    std::list<Entry> done;

    {
      std::scoped_lock lck(mtx);
      auto it = std::find_if(entries.begin(), entries.end(),
                             [&](const Entry &e) { return e.negotiation == n; });

      if (it != entries.end()) done.splice(done.end(), entries, it);
    }

    for (auto &e : done) {
      teardown(e);
    }
  });
}

void Bridge::teardown(Entry &e) noexcept {
  INFO_AUTO_CAT("teardown");

  if (e.relay) retire(std::move(e.relay));

  if (e.session) {
    e.session->state(Session::Closed);

    if (!registry.clear_if(e.session)) {
      INFO_AUTO("session={} already replaced", e.session->id());
    }
  }

  e.negotiation->media_peer().close();

  INFO_AUTO("negotiation={} packets={} dropped={}", e.negotiation->id(), e.inbound->packets(),
            e.inbound->dropped());
}

void Bridge::retire(std::unique_ptr<voice::Relay> relay) noexcept {
  relay->request_stop();

  {
    std::scoped_lock lck(reap_mtx);
    retired.emplace_back(std::move(relay));
  }

  reap_cv.notify_one();
}

void Bridge::reap(std::stop_token stoken) noexcept {
  std::unique_lock lck(reap_mtx);

  while (reap_cv.wait(lck, stoken, [this]() { return !retired.empty(); })) {
    auto relay = std::move(retired.front());
    retired.pop_front();
    joining = true;

    lck.unlock();
    relay.reset(); // joins the relay thread
    lck.lock();

    joining = false;
  }
}

void Bridge::shutdown() noexcept {
  if (shutting_down.test_and_set()) return;

  std::list<Entry> all;

  {
    std::scoped_lock lck(mtx);
    all.swap(entries);
  }

  for (auto &e : all) {
    teardown(e);
  }

  reaper.request_stop();
  if (reaper.joinable()) reaper.join();

  // relays the reaper did not reach
  std::list<std::unique_ptr<voice::Relay>> rest;

  {
    std::scoped_lock lck(reap_mtx);
    rest.swap(retired);
  }

  rest.clear();
}

} // namespace bridge
} // namespace parley
