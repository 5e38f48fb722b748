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

#include "base/conf/master.hpp"
#include "base/conf/token.hpp"
#include "bridge/bridge.hpp"
#include "media/rtc_peer.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <vector>

using namespace parley;

namespace {

namespace fs = std::filesystem;

struct MasterTest : public ::testing::Test {
  void TearDown() override {
    conf::master::reset();

    std::error_code ec;
    fs::remove(path, ec);
  }

  conf::master *create(const fs::path &cfg) {
    args = {"parley", "--cfg-file", cfg.string()};

    std::vector<char *> argv;
    for (auto &a : args) {
      argv.push_back(a.data());
    }

    return conf::master::create(static_cast<int>(argv.size()), argv.data());
  }

  void write(csv text) {
    std::ofstream out(path);
    out << text;
  }

  fs::path path{fs::temp_directory_path() / "parley_test_live.toml"};
  std::vector<string> args;
};

} // namespace

TEST(Token, DefaultsWhenEmpty) {
  const conf::token tokc("media", toml::table());

  EXPECT_TRUE(tokc.empty());
  EXPECT_EQ(tokc.val<int>("sample_rate", 8000), 8000);
  EXPECT_EQ(tokc.val("outbound_codec", "PCMU"), "PCMU");
  EXPECT_FALSE(tokc.val<bool>("enabled", false));
  EXPECT_TRUE(tokc.strings("ice_servers").empty());
  EXPECT_EQ(tokc.timeout_val("gathering_timeout", 30s), Millis(30s));
}

TEST(Token, ValuesFromTable) {
  auto result = toml::parse(R"(
    [media]
    sample_rate = 16000
    ice_servers = ["stun:a.example:3478", 7, "stun:b.example:3478"]
    gathering_timeout = { mins = 1, secs = 30, millis = 5 }
    volume = 0.5
  )");

  ASSERT_TRUE(result);
  const conf::token tokc("media", result.table());

  EXPECT_EQ(tokc.val<int>("sample_rate", 8000), 16000);
  EXPECT_DOUBLE_EQ(tokc.val<double>("volume", 1.0), 0.5);
  EXPECT_EQ(tokc.strings("ice_servers"),
            (std::vector<string>{"stun:a.example:3478", "stun:b.example:3478"}));
  EXPECT_EQ(tokc.timeout_val("gathering_timeout", 30s), Millis(90'005));
}

TEST(Token, OutsideMasterIsEmpty) {
  conf::master::reset();

  EXPECT_TRUE(conf::token("voice").empty());
}

TEST_F(MasterTest, MissingFileUsesDefaults) {
  auto *m = create("/nonexistent/parley/live.toml");

  EXPECT_TRUE(m->nominal_start());
  EXPECT_NE(m->get_msg(conf::master::InitMsg).find("not found"), string::npos);
  EXPECT_TRUE(conf::token("media").empty());
}

TEST_F(MasterTest, ParsedFileFeedsTokens) {
  write(R"(
    [media]
    outbound_codec = "PCMA"
    ssrc = 4242
    sample_rate = 8000
    ice_servers = []

    [signal]
    port = 9090
  )");

  auto *m = create(path);
  ASSERT_TRUE(m->nominal_start());

  const conf::token media_tokc("media");
  const auto opts = bridge::Bridge::session_opts(media_tokc);

  EXPECT_EQ(opts.outbound, codec::Codec::PCMA);
  EXPECT_EQ(opts.ssrc, 4242u);
  EXPECT_EQ(opts.sample_rate, 8000);

  const auto peer_opts = media::RtcPeer::make_opts(media_tokc);
  EXPECT_EQ(peer_opts.outbound, codec::Codec::PCMA);
  EXPECT_TRUE(peer_opts.ice_servers.empty());

  EXPECT_EQ(conf::token("signal").val<Port>("port", 8080), 9090);
}

TEST_F(MasterTest, ParseFailureIsFatal) {
  write("[media\noutbound_codec = ");

  auto *m = create(path);

  EXPECT_FALSE(m->nominal_start());
  EXPECT_NE(m->get_first_msg().find("parse failed"), string::npos);
}

TEST(SessionOpts, NonWaveformOutboundRejected) {
  auto result = toml::parse(R"(
    [media]
    outbound_codec = "opus"
  )");

  ASSERT_TRUE(result);

  const auto opts = bridge::Bridge::session_opts(conf::token("media", result.table()));
  EXPECT_EQ(opts.outbound, codec::Codec::PCMU);

  const auto peer_opts = media::RtcPeer::make_opts(conf::token("media", result.table()));
  EXPECT_EQ(peer_opts.outbound, codec::Codec::PCMU);
  EXPECT_EQ(peer_opts.ice_servers.size(), 1u);
}
