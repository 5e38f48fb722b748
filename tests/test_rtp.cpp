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
#include "codec/g711.hpp"
#include "rtp/header.hpp"
#include "rtp/packetizer.hpp"
#include "rtp/sink.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace parley;

namespace {

struct CaptureSink : public rtp::Sink {
  error_code write(const uint8v &packet) noexcept override {
    if (fail) return make_error_code(err::send_failure);

    packets.push_back(packet);
    return error_code();
  }

  bool fail{false};
  std::vector<uint8v> packets;
};

} // namespace

TEST(RtpHeader, ParseFixedHeader) {
  const uint8v packet{0x80, 0x00, 0x12, 0x34, 0x00, 0x00, 0x01, 0x00,
                      0x00, 0x00, 0x30, 0x39, 0xaa, 0xbb};

  rtp::Header hdr;
  std::span<const uint8_t> payload;

  ASSERT_FALSE(rtp::Header::parse(packet, hdr, payload));
  EXPECT_EQ(hdr.version, 2);
  EXPECT_EQ(hdr.payload_type, 0);
  EXPECT_EQ(hdr.seq_num, 0x1234);
  EXPECT_EQ(hdr.timestamp, 256u);
  EXPECT_EQ(hdr.ssrc, 12345u);
  ASSERT_EQ(payload.size(), 2u);
  EXPECT_EQ(payload[0], 0xaa);
}

TEST(RtpHeader, ParseSkipsCsrcAndExtension) {
  // cc=1, x=1, marker, pt 111
  const uint8v packet{0x91, 0xef, 0x00, 0x01, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00,
                      0x00, 0x03, 0x00, 0x00, 0x00, 0x04, // csrc
                      0xbe, 0xde, 0x00, 0x01,             // extension header, 1 word
                      0x10, 0x20, 0x30, 0x40,             // extension data
                      0x55};

  rtp::Header hdr;
  std::span<const uint8_t> payload;

  ASSERT_FALSE(rtp::Header::parse(packet, hdr, payload));
  EXPECT_TRUE(hdr.marker);
  EXPECT_TRUE(hdr.extension);
  EXPECT_EQ(hdr.csrc_count, 1);
  EXPECT_EQ(hdr.payload_type, 111);
  ASSERT_EQ(payload.size(), 1u);
  EXPECT_EQ(payload[0], 0x55);
}

TEST(RtpHeader, ParseStripsPadding) {
  const uint8v packet{0xa0, 0x08, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00,
                      0x00, 0x00, 0x01, 0x11, 0x22, 0x00, 0x00, 0x03};

  rtp::Header hdr;
  std::span<const uint8_t> payload;

  ASSERT_FALSE(rtp::Header::parse(packet, hdr, payload));
  EXPECT_EQ(hdr.payload_type, 8);
  EXPECT_EQ(payload.size(), 2u);
}

TEST(RtpHeader, ShortPacketRejected) {
  const uint8v packet{0x80, 0x00, 0x00};

  rtp::Header hdr;
  std::span<const uint8_t> payload;

  EXPECT_TRUE(is_err(rtp::Header::parse(packet, hdr, payload), err::bad_packet));
}

TEST(RtpHeader, WrongVersionRejected) {
  const uint8v packet(20, 0x00);

  rtp::Header hdr;
  std::span<const uint8_t> payload;

  EXPECT_TRUE(is_err(rtp::Header::parse(packet, hdr, payload), err::bad_packet));
}

TEST(RtpHeader, RtcpDetected) {
  const uint8v sender_report{0x80, 0xc8, 0x00, 0x06};
  const uint8v audio{0x80, 0x00, 0x00, 0x01};

  EXPECT_TRUE(rtp::Header::is_rtcp(sender_report));
  EXPECT_FALSE(rtp::Header::is_rtcp(audio));
}

TEST(RtpHeader, MarshalLayout) {
  rtp::Header hdr;
  hdr.payload_type = 8;
  hdr.seq_num = 0xfffe;
  hdr.timestamp = 0x01020304;
  hdr.ssrc = 12345;

  uint8v out;
  hdr.marshal(out);

  ASSERT_EQ(out.size(), rtp::Header::size());
  EXPECT_EQ(out[0], 0x80);
  EXPECT_EQ(out[1], 0x08);
  EXPECT_EQ(out[2], 0xff);
  EXPECT_EQ(out[3], 0xfe);
  EXPECT_EQ(out.to_uint32(4, 4), 0x01020304u);
  EXPECT_EQ(out.to_uint32(8, 4), 12345u);
}

TEST(Packetizer, CountersAdvancePerPacket) {
  auto sink = std::make_shared<CaptureSink>();
  rtp::Packetizer pz(codec::Codec::PCMU, 12345, sink);

  const uint8v pcm(320, 0x00);
  const uint8v short_pcm(100, 0x00);

  for (int i = 0; i < 10; i++) {
    ASSERT_FALSE(pz.send(pcm));
  }

  ASSERT_FALSE(pz.send(short_pcm));

  EXPECT_EQ(pz.sequence(), 11);
  EXPECT_EQ(pz.timestamp(), 10u * 160u + 50u);
  ASSERT_EQ(sink->packets.size(), 11u);

  rtp::Header hdr;
  std::span<const uint8_t> payload;

  // header carries the values before the increment
  ASSERT_FALSE(rtp::Header::parse(sink->packets[1], hdr, payload));
  EXPECT_EQ(hdr.seq_num, 1);
  EXPECT_EQ(hdr.timestamp, 160u);
  EXPECT_EQ(hdr.ssrc, 12345u);
  EXPECT_EQ(hdr.payload_type, 0);
  EXPECT_EQ(payload.size(), 160u);
}

TEST(Packetizer, SequenceWraps) {
  rtp::Packetizer pz(codec::Codec::PCMA, 1, std::make_shared<CaptureSink>());
  const uint8v pcm(2, 0x00);

  for (int i = 0; i < 65537; i++) {
    ASSERT_FALSE(pz.send(pcm));
  }

  EXPECT_EQ(pz.sequence(), 1);
  EXPECT_EQ(pz.timestamp(), 65537u);
}

TEST(Packetizer, TimestampWraps) {
  constexpr rtp_ts_t first_ts = 0xffffffffu - 999u;

  auto sink = std::make_shared<CaptureSink>();
  rtp::Packetizer pz(codec::Codec::PCMU, 1, sink, 65535, first_ts);

  // 600 samples per message, the second message crosses 2^32
  const uint8v pcm(1200, 0x00);

  for (int i = 0; i < 3; i++) {
    ASSERT_FALSE(pz.send(pcm));
  }

  EXPECT_EQ(pz.timestamp(), 800u); // (first_ts + 1800) mod 2^32
  EXPECT_EQ(pz.sequence(), 2);
  ASSERT_EQ(sink->packets.size(), 3u);

  const std::vector<rtp_ts_t> want_ts{first_ts, first_ts + 600u, 200u};
  const std::vector<seq_num_t> want_seq{65535, 0, 1};

  for (size_t i = 0; i < sink->packets.size(); i++) {
    rtp::Header hdr;
    std::span<const uint8_t> payload;

    ASSERT_FALSE(rtp::Header::parse(sink->packets[i], hdr, payload));
    EXPECT_EQ(hdr.timestamp, want_ts[i]);
    EXPECT_EQ(hdr.seq_num, want_seq[i]);
  }
}

TEST(Packetizer, TimestampWrapsFromZero) {
  // 1 MB messages (2^19 samples each), 2^13 of them advance exactly 2^32
  struct CountSink : public rtp::Sink {
    error_code write(const uint8v &) noexcept override {
      ++count;
      return error_code();
    }

    size_t count{0};
  };

  auto sink = std::make_shared<CountSink>();
  rtp::Packetizer pz(codec::Codec::PCMU, 1, sink);
  const uint8v pcm(1u << 20, 0x00);

  for (int i = 0; i < (1 << 13) + 1; i++) {
    ASSERT_FALSE(pz.send(pcm));
  }

  EXPECT_EQ(sink->count, (1u << 13) + 1u);
  EXPECT_EQ(pz.timestamp(), 1u << 19);
  EXPECT_EQ(pz.sequence(), (1 << 13) + 1);
}

TEST(Packetizer, EmptyInputProducesNoPacket) {
  auto sink = std::make_shared<CaptureSink>();
  rtp::Packetizer pz(codec::Codec::PCMU, 1, sink);

  EXPECT_FALSE(pz.send(std::span<const uint8_t>()));
  EXPECT_TRUE(pz.next_packet(std::span<const uint8_t>()).empty());
  EXPECT_TRUE(sink->packets.empty());
  EXPECT_EQ(pz.sequence(), 0);
}

TEST(Packetizer, SinkFailureReported) {
  auto sink = std::make_shared<CaptureSink>();
  sink->fail = true;

  rtp::Packetizer pz(codec::Codec::PCMU, 1, sink);
  const uint8v pcm(4, 0x00);

  EXPECT_TRUE(is_err(pz.send(pcm), err::send_failure));
  EXPECT_EQ(pz.sequence(), 1);
}

TEST(Packetizer, FreshPacketizerStartsAtZero) {
  auto sink = std::make_shared<CaptureSink>();
  const uint8v pcm(320, 0x00);

  {
    rtp::Packetizer first(codec::Codec::PCMU, 1, sink);
    ASSERT_FALSE(first.send(pcm));
    ASSERT_FALSE(first.send(pcm));
  }

  rtp::Packetizer second(codec::Codec::PCMU, 1, sink);
  EXPECT_EQ(second.sequence(), 0);
  EXPECT_EQ(second.timestamp(), 0u);
}
