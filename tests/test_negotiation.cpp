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

#include "fakes.hpp"
#include "media/negotiation.hpp"

#include <gtest/gtest.h>

using namespace parley;
using namespace parley::test;
using media::PeerState;

namespace {

struct NegotiationTest : public ::testing::Test {
  std::shared_ptr<media::Negotiation> make() {
    return media::Negotiation::create(
        std::make_unique<FakePeer>(hooks),
        media::Negotiation::Handlers{
            .on_connected = [this](std::shared_ptr<media::Negotiation>) { connected++; },
            .on_closed = [this](std::shared_ptr<media::Negotiation>) { closed++; }});
  }

  std::shared_ptr<FakePeer::PeerHooks> hooks{std::make_shared<FakePeer::PeerHooks>()};
  int connected{0};
  int closed{0};
};

} // namespace

TEST_F(NegotiationTest, AnswerProduced) {
  auto n = make();
  string answer;

  ASSERT_FALSE(n->accept("v=0 offer", answer));
  EXPECT_EQ(answer, "answer-to:v=0 offer");
}

TEST_F(NegotiationTest, PeerFailureIsNegotiationFailed) {
  hooks->negotiate_fails = true;

  auto n = make();
  string answer;

  EXPECT_TRUE(is_err(n->accept("v=0", answer), err::negotiation_failed));
  EXPECT_TRUE(answer.empty());
}

TEST_F(NegotiationTest, ConnectedFiresOnce) {
  auto n = make();
  string answer;
  ASSERT_FALSE(n->accept("v=0", answer));

  hooks->state(PeerState::Connecting);
  hooks->state(PeerState::Connected);
  hooks->state(PeerState::Connected);

  EXPECT_EQ(connected, 1);
  EXPECT_EQ(closed, 0);
  EXPECT_TRUE(n->connected());
}

TEST_F(NegotiationTest, ClosedFiresOnceOnFirstTerminalState) {
  auto n = make();
  string answer;
  ASSERT_FALSE(n->accept("v=0", answer));

  hooks->state(PeerState::Connected);
  hooks->state(PeerState::Disconnected);
  hooks->state(PeerState::Failed);
  hooks->state(PeerState::Closed);

  EXPECT_EQ(connected, 1);
  EXPECT_EQ(closed, 1);
}

TEST_F(NegotiationTest, NoConnectAfterClose) {
  auto n = make();
  string answer;
  ASSERT_FALSE(n->accept("v=0", answer));

  hooks->state(PeerState::Failed);
  hooks->state(PeerState::Connected);

  EXPECT_EQ(connected, 0);
  EXPECT_EQ(closed, 1);
}

TEST_F(NegotiationTest, ReleasedNegotiationIgnoresStates) {
  auto n = make();
  string answer;
  ASSERT_FALSE(n->accept("v=0", answer));

  // the peer keeps its handler but the negotiation is gone
  auto state_h = hooks->state_h;
  n.reset();

  if (state_h) state_h(PeerState::Connected);

  EXPECT_EQ(connected, 0);
}
