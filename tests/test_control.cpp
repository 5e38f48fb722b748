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

#include "base/error.hpp"
#include "voice/control_event.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <string>

using namespace parley;
using namespace parley::voice;

TEST(ControlEvent, FinalTranscript) {
  ControlEvent ev;

  ASSERT_FALSE(ControlEvent::parse(
      R"({"type":"transcript","role":"agent","final":true,"text":"Hello there"})", ev));

  EXPECT_EQ(ev.kind, "transcript");
  ASSERT_TRUE(ev.is<ControlEvent::Transcript>());

  const auto &t = ev.as<ControlEvent::Transcript>();
  EXPECT_EQ(t.role, "agent");
  EXPECT_TRUE(t.final);
  EXPECT_EQ(t.text, "Hello there");
  EXPECT_TRUE(t.delta.empty());
}

TEST(ControlEvent, PartialTranscriptDefaultsNotFinal) {
  ControlEvent ev;

  ASSERT_FALSE(ControlEvent::parse(R"({"type":"transcript","role":"user","delta":"Hel"})", ev));

  const auto &t = ev.as<ControlEvent::Transcript>();
  EXPECT_FALSE(t.final);
  EXPECT_EQ(t.delta, "Hel");
}

TEST(ControlEvent, ErrorAndState) {
  ControlEvent err_ev;
  ASSERT_FALSE(ControlEvent::parse(R"({"type":"error","error":"quota"})", err_ev));
  EXPECT_EQ(err_ev.as<ControlEvent::Error>().error, "quota");

  ControlEvent state_ev;
  ASSERT_FALSE(ControlEvent::parse(R"({"type":"state","state":"listening"})", state_ev));
  EXPECT_EQ(state_ev.as<ControlEvent::State>().state, "listening");
}

TEST(ControlEvent, UnknownKindKeepsRawText) {
  constexpr csv raw{R"({"type":"pong","timestamp":12.5})"};
  ControlEvent ev;

  ASSERT_FALSE(ControlEvent::parse(raw, ev));
  EXPECT_EQ(ev.kind, "pong");
  ASSERT_TRUE(ev.is<ControlEvent::Unknown>());
  EXPECT_EQ(ev.as<ControlEvent::Unknown>().raw, raw);
}

TEST(ControlEvent, MalformedJson) {
  ControlEvent ev;

  EXPECT_TRUE(is_err(ControlEvent::parse("{not valid json", ev), err::malformed_control));
}

TEST(ControlEvent, MissingType) {
  ControlEvent ev;

  EXPECT_TRUE(is_err(ControlEvent::parse(R"({"role":"agent"})", ev), err::malformed_control));
}

TEST(ControlEvent, NonStringType) {
  ControlEvent ev;

  EXPECT_TRUE(is_err(ControlEvent::parse(R"({"type":7})", ev), err::malformed_control));
  EXPECT_TRUE(is_err(ControlEvent::parse(R"(["type"])", ev), err::malformed_control));
}

TEST(ControlEvent, DenseArrayIsNotMalformed) {
  // two bytes of text per element, far more slots than the initial pool holds
  string zeros("0");
  for (auto i = 1; i < 2000; ++i) zeros.append(",0");

  const auto raw = fmt::format(R"({{"type":"debug","v":[{}]}})", zeros);
  ControlEvent ev;

  ASSERT_FALSE(ControlEvent::parse(raw, ev));
  EXPECT_EQ(ev.kind, "debug");
  ASSERT_TRUE(ev.is<ControlEvent::Unknown>());
  EXPECT_EQ(ev.as<ControlEvent::Unknown>().raw, raw);
}

TEST(ControlEvent, DenseTranscriptFields) {
  string zeros("0");
  for (auto i = 1; i < 200; ++i) zeros.append(",0");

  const auto raw = fmt::format(
      R"({{"type":"transcript","role":"user","final":true,"text":"ok","w":[{}]}})", zeros);
  ControlEvent ev;

  ASSERT_FALSE(ControlEvent::parse(raw, ev));
  ASSERT_TRUE(ev.is<ControlEvent::Transcript>());
  EXPECT_EQ(ev.as<ControlEvent::Transcript>().text, "ok");
}
