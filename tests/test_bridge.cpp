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
#include "bridge/registry.hpp"
#include "fakes.hpp"
#include "rtp/header.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace parley;
using namespace parley::test;
using media::PeerState;

namespace {

struct BridgeTest : public ::testing::Test {
  media::PeerFactory factory() {
    return [this]() -> std::unique_ptr<media::Peer> {
      hooks.emplace_back(std::make_shared<FakePeer::PeerHooks>());
      return std::make_unique<FakePeer>(hooks.back());
    };
  }

  // run posted teardowns
  void drain() {
    io_ctx.restart();
    io_ctx.run();
  }

  asio::io_context io_ctx;
  bridge::Registry registry;
  FakeConnector connector;
  std::vector<std::shared_ptr<FakePeer::PeerHooks>> hooks;
  bridge::Bridge bridge{io_ctx, registry, factory(), connector, bridge::Session::Opts()};
};

uint8v pcmu_packet() {
  rtp::Header hdr;
  hdr.payload_type = 0;

  uint8v packet;
  hdr.marshal(packet);
  packet.append(uint8v(160, 0xff).span());

  return packet;
}

} // namespace

TEST_F(BridgeTest, OfferAnswered) {
  string answer;

  ASSERT_FALSE(bridge.offer("v=0 browser", answer));
  EXPECT_EQ(answer, "answer-to:v=0 browser");
  EXPECT_EQ(bridge.live(), 1u);
  EXPECT_EQ(registry.active(), nullptr);
}

TEST_F(BridgeTest, FailedOfferIsReleased) {
  connector.create_fails = true;

  auto failing = [this]() -> std::unique_ptr<media::Peer> {
    hooks.emplace_back(std::make_shared<FakePeer::PeerHooks>());
    hooks.back()->negotiate_fails = true;
    return std::make_unique<FakePeer>(hooks.back());
  };

  bridge::Bridge b(io_ctx, registry, failing, connector, bridge::Session::Opts());

  string answer;
  EXPECT_TRUE(is_err(b.offer("v=0", answer), err::negotiation_failed));

  drain();

  EXPECT_EQ(b.live(), 0u);
  EXPECT_EQ(hooks.back()->closes, 1);
}

TEST_F(BridgeTest, ConnectedSessionRelaysBothWays) {
  string answer;
  ASSERT_FALSE(bridge.offer("v=0", answer));

  hooks[0]->state(PeerState::Connected);

  auto session = registry.active();
  ASSERT_NE(session, nullptr);
  ASSERT_TRUE(eventually([&]() { return session->has_channel(); }));

  // browser to voice
  hooks[0]->packet(pcmu_packet());
  {
    std::scoped_lock lck(connector.channel->mtx);
    ASSERT_EQ(connector.channel->written.size(), 1u);
    EXPECT_EQ(connector.channel->written[0].size(), 320u);
  }

  // voice to browser
  connector.channel->push_binary(uint8v(320, 0x00));
  EXPECT_TRUE(eventually([&]() { return hooks[0]->sink->count() == 1; }));

  hooks[0]->state(PeerState::Disconnected);
  drain();

  EXPECT_EQ(registry.active(), nullptr);
  EXPECT_EQ(bridge.live(), 0u);
  EXPECT_EQ(hooks[0]->closes, 1);
  EXPECT_TRUE(connector.channel->is_closed());
  EXPECT_EQ(session->state(), bridge::Session::Closed);
}

TEST_F(BridgeTest, StaleTeardownKeepsReplacement) {
  connector.create_fails = true;

  string answer;
  ASSERT_FALSE(bridge.offer("v=0 first", answer));
  ASSERT_FALSE(bridge.offer("v=0 second", answer));

  hooks[0]->state(PeerState::Connected);
  auto first = registry.active();

  hooks[1]->state(PeerState::Connected);
  auto second = registry.active();

  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);
  EXPECT_NE(first, second);

  hooks[0]->state(PeerState::Closed);
  drain();

  EXPECT_EQ(registry.active(), second);
  EXPECT_EQ(bridge.live(), 1u);
}

TEST_F(BridgeTest, FreshSessionCountersStartAtZero) {
  connector.create_fails = true;

  string answer;
  ASSERT_FALSE(bridge.offer("v=0", answer));
  hooks[0]->state(PeerState::Connected);

  auto first = registry.active();
  ASSERT_FALSE(first->outbound().send(uint8v(320, 0x00)));
  EXPECT_EQ(first->outbound().sequence(), 1);

  ASSERT_FALSE(bridge.offer("v=0", answer));
  hooks[1]->state(PeerState::Connected);

  auto second = registry.active();
  EXPECT_EQ(second->outbound().sequence(), 0);
  EXPECT_EQ(second->outbound().timestamp(), 0u);
}

TEST_F(BridgeTest, TeardownDoesNotWaitOnRelay) {
  connector.hold_create = true;
  connector.ignore_stop = true;

  string answer;
  ASSERT_FALSE(bridge.offer("v=0", answer));

  hooks[0]->state(PeerState::Connected);
  ASSERT_TRUE(eventually([&]() { return connector.calls.load() == 1; }));

  // the relay is stuck creating its call, teardown must still complete
  hooks[0]->state(PeerState::Disconnected);
  drain();

  EXPECT_EQ(bridge.live(), 0u);
  EXPECT_EQ(registry.active(), nullptr);
  EXPECT_EQ(hooks[0]->closes, 1);
  EXPECT_EQ(bridge.reaping(), 1u);

  connector.release();

  EXPECT_TRUE(eventually([&]() { return bridge.reaping() == 0; }));
}

TEST_F(BridgeTest, ShutdownClosesEverything) {
  string answer;
  ASSERT_FALSE(bridge.offer("v=0", answer));
  ASSERT_FALSE(bridge.offer("v=0", answer));

  hooks[0]->state(PeerState::Connected);
  ASSERT_TRUE(eventually([&]() { return registry.active() && registry.active()->has_channel(); }));

  bridge.shutdown();

  EXPECT_EQ(bridge.live(), 0u);
  EXPECT_EQ(registry.active(), nullptr);
  EXPECT_EQ(hooks[0]->closes, 1);
  EXPECT_EQ(hooks[1]->closes, 1);

  EXPECT_TRUE(is_err(bridge.offer("v=0", answer), err::negotiation_failed));
}
