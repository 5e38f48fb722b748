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

#include "base/asio.hpp"
#include "base/conf/token.hpp"
#include "base/error.hpp"
#include "voice/call_request.hpp"
#include "voice/client.hpp"
#include "voice/duration.hpp"
#include "voice/service.hpp"
#include "voice/url.hpp"
#include "voice/ws_channel.hpp"

#include <ArduinoJson.h>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <cstdlib>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <stop_token>
#include <thread>

using namespace parley;
using namespace parley::voice;

namespace {

using tcp = asio::ip::tcp;
namespace websocket = boost::beast::websocket;

// listens on loopback and never accepts, the kernel completes the connect
// and the peer never speaks
struct SilentPeer {
  asio::io_context io_ctx;
  tcp::acceptor acceptor{io_ctx, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)};

  string url(csv scheme) const {
    return fmt::format("{}://127.0.0.1:{}/calls", scheme, acceptor.local_endpoint().port());
  }
};

// accepts one websocket session and echoes every message back
struct EchoPeer {
  asio::io_context io_ctx;
  tcp::acceptor acceptor{io_ctx, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)};
  std::jthread thread;

  EchoPeer() {
    thread = std::jthread([this]() {
      error_code ec;
      tcp_socket sock(io_ctx);

      if (acceptor.accept(sock, ec); ec) return;

      websocket::stream<tcp_socket> ws(std::move(sock));
      if (ws.accept(ec); ec) return;

      for (;;) {
        boost::beast::flat_buffer buffer;

        if (ws.read(buffer, ec); ec) return;

        ws.binary(ws.got_binary());
        if (ws.write(buffer.data(), ec); ec) return;
      }
    });
  }

  string url() const {
    return fmt::format("ws://127.0.0.1:{}/session", acceptor.local_endpoint().port());
  }
};

} // namespace

TEST(Duration, FormatsSeconds) {
  EXPECT_EQ(Duration(60s).to_string(), "60s");
  EXPECT_EQ(Duration(400ms).to_string(), "0.4s");
  EXPECT_EQ(Duration(1500ms).to_string(), "1.5s");
  EXPECT_EQ(Duration().to_string(), "0s");
}

TEST(Duration, ParsesDurationStrings) {
  Duration d;

  ASSERT_TRUE(Duration::parse("1m30s", d));
  EXPECT_EQ(d.get(), Nanos(90s));

  ASSERT_TRUE(Duration::parse("250ms", d));
  EXPECT_EQ(d.get(), Nanos(250ms));

  ASSERT_TRUE(Duration::parse("1h", d));
  EXPECT_EQ(d.get(), Nanos(3600s));

  ASSERT_TRUE(Duration::parse("0.4s", d));
  EXPECT_EQ(d.get(), Nanos(400ms));

  ASSERT_TRUE(Duration::parse("-2s", d));
  EXPECT_EQ(d.get(), Nanos(-2s));
}

TEST(Duration, ParsesPlainSeconds) {
  Duration d;

  ASSERT_TRUE(Duration::parse("30", d));
  EXPECT_EQ(d.get(), Nanos(30s));

  ASSERT_TRUE(Duration::parse("0", d));
  EXPECT_TRUE(d.zero());
}

TEST(Duration, RejectsGarbage) {
  Duration d;

  EXPECT_FALSE(Duration::parse("", d));
  EXPECT_FALSE(Duration::parse("abc", d));
  EXPECT_FALSE(Duration::parse("10x", d));
  EXPECT_FALSE(Duration::parse("s", d));
}

TEST(Url, SecureDefaults) {
  Url url;

  ASSERT_TRUE(Url::parse("wss://voice.example.com/calls/abc?x=1", url));
  EXPECT_EQ(url.scheme, "wss");
  EXPECT_EQ(url.host, "voice.example.com");
  EXPECT_EQ(url.port, "443");
  EXPECT_EQ(url.target, "/calls/abc?x=1");
  EXPECT_TRUE(url.secure());
  EXPECT_EQ(url.host_header(), "voice.example.com");
}

TEST(Url, ExplicitPortAndNoPath) {
  Url url;

  ASSERT_TRUE(Url::parse("http://127.0.0.1:8086", url));
  EXPECT_EQ(url.port, "8086");
  EXPECT_EQ(url.target, "/");
  EXPECT_FALSE(url.secure());
  EXPECT_EQ(url.host_header(), "127.0.0.1:8086");
}

TEST(Url, QueryWithoutPath) {
  Url url;

  ASSERT_TRUE(Url::parse("ws://host?token=1", url));
  EXPECT_EQ(url.target, "/?token=1");
}

TEST(Url, Ipv6Literal) {
  Url url;

  ASSERT_TRUE(Url::parse("https://[::1]:9443/api", url));
  EXPECT_EQ(url.host, "::1");
  EXPECT_EQ(url.port, "9443");
}

TEST(Url, Rejected) {
  Url url;

  EXPECT_FALSE(Url::parse("ftp://host/file", url));
  EXPECT_FALSE(Url::parse("no-scheme", url));
  EXPECT_FALSE(Url::parse("https:///path", url));
  EXPECT_FALSE(Url::parse("https://host:port/", url));
}

TEST(CallRequest, OmitsEmptyFields) {
  CallRequest req;
  req.system_prompt = "be brief";

  const auto json = req.to_json();

  DynamicJsonDocument doc(1024);
  ASSERT_FALSE(deserializeJson(doc, json));

  EXPECT_EQ(doc.as<JsonObjectConst>().size(), 1u);
  EXPECT_EQ(doc["systemPrompt"].as<string>(), "be brief");
}

TEST(CallRequest, SerializesNestedSettings) {
  CallRequest req;
  req.model = "fixie-ai/ultravox";
  req.max_duration = 5min;
  req.inactivity_messages.push_back(TimedMessage{20s, "bye", "END_BEHAVIOR_HANG_UP_SOFT"});
  req.medium = WebSocketMedium{.input_sample_rate = 8000, .output_sample_rate = 8000};
  req.agent_greeting = AgentGreeting{.text = "Hello!"};
  req.vad = VadSettings{.turn_endpoint_delay = 400ms};
  req.metadata.emplace("source", "browser");
  req.prior_call_id = "not-in-body";
  req.agent_id = "not-in-body";

  DynamicJsonDocument doc(4096);
  ASSERT_FALSE(deserializeJson(doc, req.to_json()));

  EXPECT_EQ(doc["model"].as<string>(), "fixie-ai/ultravox");
  EXPECT_EQ(doc["maxDuration"].as<string>(), "300s");
  EXPECT_EQ(doc["inactivityMessages"][0]["duration"].as<string>(), "20s");
  EXPECT_EQ(doc["inactivityMessages"][0]["endBehavior"].as<string>(), "END_BEHAVIOR_HANG_UP_SOFT");
  EXPECT_EQ(doc["medium"]["serverWebSocket"]["inputSampleRate"].as<int>(), 8000);
  EXPECT_EQ(doc["medium"]["serverWebSocket"]["outputSampleRate"].as<int>(), 8000);
  EXPECT_TRUE(doc["medium"]["serverWebSocket"]["clientBufferSizeMs"].isNull());
  EXPECT_EQ(doc["firstSpeakerSettings"]["agent"]["text"].as<string>(), "Hello!");
  EXPECT_EQ(doc["vadSettings"]["turnEndpointDelay"].as<string>(), "0.4s");
  EXPECT_EQ(doc["metadata"]["source"].as<string>(), "browser");
  EXPECT_TRUE(doc["priorCallId"].isNull());
  EXPECT_TRUE(doc["agentId"].isNull());
  EXPECT_TRUE(doc["temperature"].isNull());
}

TEST(CallRequest, SerializesToolsVoiceAndDataConnection) {
  CallRequest req;
  req.voice = "Mark";
  req.external_voice = ExternalVoice{.provider = "elevenLabs", .voice_id = "v-21", .speed = 1.1};
  req.initial_messages.push_back(InitialMessage{.role = "MESSAGE_ROLE_USER", .text = "hi"});
  req.selected_tools.push_back(SelectedTool{.tool_name = "queryCorpus"});
  req.selected_tools.push_back(SelectedTool{.tool_id = "t-9",
                                            .name_override = "lookup",
                                            .auth_tokens = {{"apiKey", "secret"}}});
  req.data_connection = DataConnection{.websocket_url = "wss://data.example/feed",
                                       .sample_rate = 16000};

  DynamicJsonDocument doc(4096);
  ASSERT_FALSE(deserializeJson(doc, req.to_json()));

  // a named voice and an external voice are exclusive
  EXPECT_TRUE(doc["voice"].isNull());
  EXPECT_EQ(doc["externalVoice"]["elevenLabs"]["voiceId"].as<string>(), "v-21");
  EXPECT_DOUBLE_EQ(doc["externalVoice"]["elevenLabs"]["speed"].as<double>(), 1.1);
  EXPECT_TRUE(doc["externalVoice"]["elevenLabs"]["model"].isNull());

  EXPECT_EQ(doc["initialMessages"][0]["role"].as<string>(), "MESSAGE_ROLE_USER");
  EXPECT_EQ(doc["initialMessages"][0]["text"].as<string>(), "hi");

  ASSERT_EQ(doc["selectedTools"].size(), 2u);
  EXPECT_EQ(doc["selectedTools"][0]["toolName"].as<string>(), "queryCorpus");
  EXPECT_TRUE(doc["selectedTools"][0]["toolId"].isNull());
  EXPECT_EQ(doc["selectedTools"][1]["toolId"].as<string>(), "t-9");
  EXPECT_EQ(doc["selectedTools"][1]["nameOverride"].as<string>(), "lookup");
  EXPECT_EQ(doc["selectedTools"][1]["authTokens"]["apiKey"].as<string>(), "secret");

  EXPECT_EQ(doc["dataConnection"]["websocketUrl"].as<string>(), "wss://data.example/feed");
  EXPECT_EQ(doc["dataConnection"]["audioConfig"]["sampleRate"].as<int>(), 16000);
  EXPECT_TRUE(doc["dataConnection"]["audioConfig"]["channelMode"].isNull());
}

TEST(CallRequest, UserSpeaksFirst) {
  CallRequest req;
  req.agent_greeting = AgentGreeting{.text = "Hello!"};
  req.user_greeting = UserGreeting{.fallback_delay = 5s, .fallback_text = "Anyone there?"};

  DynamicJsonDocument doc(2048);
  ASSERT_FALSE(deserializeJson(doc, req.to_json()));

  EXPECT_TRUE(doc["firstSpeakerSettings"]["agent"].isNull());
  EXPECT_EQ(doc["firstSpeakerSettings"]["user"]["fallback"]["delay"].as<string>(), "5s");
  EXPECT_EQ(doc["firstSpeakerSettings"]["user"]["fallback"]["text"].as<string>(),
            "Anyone there?");

  // no fallback, the agent waits for the user indefinitely
  req.user_greeting = UserGreeting();
  ASSERT_FALSE(deserializeJson(doc, req.to_json()));

  EXPECT_TRUE(doc["firstSpeakerSettings"]["user"].is<JsonObjectConst>());
  EXPECT_TRUE(doc["firstSpeakerSettings"]["user"]["fallback"].isNull());
}

TEST(CallRequest, Endpoints) {
  CallRequest req;
  EXPECT_EQ(req.url("https://api.example/api"), "https://api.example/api/calls");

  req.agent_id = "agent-7";
  EXPECT_EQ(req.url("https://api.example/api/"), "https://api.example/api/agents/agent-7/calls");

  req.agent_id.clear();
  req.enable_greeting_prompt = true;
  EXPECT_EQ(req.url("https://api.example/api"),
            "https://api.example/api/calls?enableGreetingPrompt=true");

  req.prior_call_id = "abc 1";
  EXPECT_EQ(req.url("https://api.example/api"),
            "https://api.example/api/calls?enableGreetingPrompt=true&priorCallId=abc%201");
}

TEST(Call, ParsesResponse) {
  Call call;

  ASSERT_FALSE(Call::parse(R"({"callId":"c1","joinUrl":"wss://j/1","maxDuration":"300s",
                               "joinTimeout":30,"recordingEnabled":true,"errorCount":2})",
                           call));

  EXPECT_EQ(call.call_id, "c1");
  EXPECT_EQ(call.join_url, "wss://j/1");
  EXPECT_EQ(call.max_duration.get(), Nanos(300s));
  EXPECT_EQ(call.join_timeout.get(), Nanos(30s));
  EXPECT_TRUE(call.recording_enabled);
  EXPECT_EQ(call.error_count, 2);
}

TEST(Call, MissingJoinUrlIsError) {
  Call call;

  EXPECT_TRUE(is_err(Call::parse(R"({"callId":"c1"})", call), err::call_create_failed));
  EXPECT_TRUE(is_err(Call::parse("<html>", call), err::call_create_failed));
}

TEST(Client, MissingApiKeyFailsBeforeRequest) {
  ::unsetenv(Client::API_KEY_ENV.data());

  // unroutable base, a request attempt would not fail fast
  Client client(Client::Opts{.api_base = "https://192.0.2.1/api"});
  EXPECT_FALSE(client.has_api_key());

  Call call;
  EXPECT_TRUE(is_err(client.create_call(CallRequest(), call), err::call_create_failed));
}

TEST(Client, ApiKeyFromEnvironment) {
  ::setenv(Client::API_KEY_ENV.data(), "from-env", 1);

  Client client(Client::Opts());
  EXPECT_TRUE(client.has_api_key());

  ::unsetenv(Client::API_KEY_ENV.data());
}

TEST(Service, DefaultRequest) {
  const auto req = Service::make_request(conf::token("voice", toml::table()));

  EXPECT_EQ(req.model, "fixie-ai/ultravox");
  EXPECT_EQ(req.voice, "Mark");
  EXPECT_EQ(req.max_duration.to_string(), "300s");
  EXPECT_EQ(req.join_timeout.to_string(), "30s");
  ASSERT_EQ(req.inactivity_messages.size(), 3u);
  EXPECT_EQ(req.inactivity_messages[2].end_behavior, "END_BEHAVIOR_HANG_UP_SOFT");
  ASSERT_TRUE(req.medium.has_value());
  EXPECT_EQ(req.medium->input_sample_rate, 8000);
  ASSERT_TRUE(req.agent_greeting.has_value());
  EXPECT_EQ(req.agent_greeting->text, "Hello! How can I assist you today?");
  ASSERT_TRUE(req.vad.has_value());
  EXPECT_EQ(req.vad->turn_endpoint_delay.to_string(), "0.4s");
  EXPECT_TRUE(req.agent_id.empty());
}

TEST(Service, ConfiguredRequest) {
  auto result = toml::parse(R"(
    [voice]
    model = "custom-model"
    max_duration = "1m30s"
    join_timeout = 10
    first_speaker_text = ""
    agent_id = "agent-1"

    [[voice.inactivity_messages]]
    duration = "8s"
    message = "Still there?"
  )");

  ASSERT_TRUE(result);
  const auto req = Service::make_request(conf::token("voice", result.table()));

  EXPECT_EQ(req.model, "custom-model");
  EXPECT_EQ(req.max_duration.to_string(), "90s");
  EXPECT_EQ(req.join_timeout.to_string(), "10s");
  EXPECT_FALSE(req.agent_greeting.has_value());
  EXPECT_EQ(req.first_speaker, "FIRST_SPEAKER_AGENT");
  EXPECT_EQ(req.agent_id, "agent-1");
  ASSERT_EQ(req.inactivity_messages.size(), 1u);
  EXPECT_EQ(req.inactivity_messages[0].message, "Still there?");
  EXPECT_EQ(req.inactivity_messages[0].end_behavior, "END_BEHAVIOR_UNSPECIFIED");
}

TEST(Client, PostTimesOutOnSilentServer) {
  SilentPeer peer;
  Client client(Client::Opts{.api_key = "key", .timeout = 250ms});

  Url url;
  ASSERT_TRUE(Url::parse(peer.url("http"), url));

  Client::Response resp;
  const auto start = std::chrono::steady_clock::now();

  EXPECT_EQ(client.post(url, "{}", resp), asio::error::timed_out);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(Client, StopRequestAbandonsPost) {
  SilentPeer peer;
  Client client(Client::Opts{.api_key = "key", .timeout = 60s});

  Url url;
  ASSERT_TRUE(Url::parse(peer.url("http"), url));

  std::stop_source stop;
  std::jthread stopper([&stop]() {
    std::this_thread::sleep_for(100ms);
    stop.request_stop();
  });

  Client::Response resp;
  const auto start = std::chrono::steady_clock::now();

  EXPECT_EQ(client.post(url, "{}", resp, stop.get_token()), asio::error::operation_aborted);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(WsChannel, InvalidUrl) {
  WsChannel channel;

  EXPECT_TRUE(channel.dial("http://"));
}

TEST(WsChannel, DialTimesOutWithoutUpgrade) {
  SilentPeer peer;
  WsChannel channel(250ms);

  EXPECT_EQ(channel.dial(peer.url("ws")), asio::error::timed_out);
}

TEST(WsChannel, CloseAbortsDial) {
  SilentPeer peer;
  WsChannel channel(60s);

  std::jthread closer([&channel]() {
    std::this_thread::sleep_for(100ms);
    channel.close();
  });

  const auto start = std::chrono::steady_clock::now();

  EXPECT_EQ(channel.dial(peer.url("ws")), asio::error::operation_aborted);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

  Channel::Frame frame;
  EXPECT_TRUE(is_err(channel.read(frame), err::transport_read));
}

TEST(WsChannel, WritesAndReadsFrames) {
  EchoPeer peer;
  WsChannel channel(5s);

  ASSERT_FALSE(channel.dial(peer.url()));

  const uint8v pcm{0x01, 0x00, 0xff, 0x7f};
  ASSERT_FALSE(channel.write_binary(pcm));

  Channel::Frame frame;
  ASSERT_FALSE(channel.read(frame));
  EXPECT_TRUE(frame.binary());
  EXPECT_EQ(frame.payload, pcm);

  // the peer sees the closing handshake and its read fails
  channel.close();
  EXPECT_TRUE(is_err(channel.read(frame), err::transport_read));
}

TEST(Service, ToolsVoiceMessagesAndDataConnection) {
  auto result = toml::parse(R"(
    [voice]
    first_speaker = "user"
    user_fallback_delay = "4s"
    user_fallback_text = "Hello?"

    [voice.external_voice]
    provider = "cartesia"
    voice_id = "c-1"
    model = "sonic"

    [[voice.initial_messages]]
    role = "MESSAGE_ROLE_AGENT"
    text = "Welcome back."

    [[voice.selected_tools]]
    tool_name = "hangUp"

    [[voice.selected_tools]]
    name_override = "dropped, names no tool"

    [[voice.selected_tools]]
    tool_id = "t-1"
    auth_tokens = { token = "abc" }

    [voice.data_connection]
    websocket_url = "wss://data.example/feed"
    channel_mode = "CHANNEL_MODE_SEPARATED"
  )");

  ASSERT_TRUE(result);
  const auto req = Service::make_request(conf::token("voice", result.table()));

  ASSERT_TRUE(req.user_greeting.has_value());
  EXPECT_EQ(req.user_greeting->fallback_delay.to_string(), "4s");
  EXPECT_EQ(req.user_greeting->fallback_text, "Hello?");
  EXPECT_FALSE(req.agent_greeting.has_value());
  EXPECT_TRUE(req.first_speaker.empty());

  ASSERT_TRUE(req.external_voice.has_value());
  EXPECT_EQ(req.external_voice->provider, "cartesia");
  EXPECT_EQ(req.external_voice->voice_id, "c-1");
  EXPECT_EQ(req.external_voice->model, "sonic");

  ASSERT_EQ(req.initial_messages.size(), 1u);
  EXPECT_EQ(req.initial_messages[0].role, "MESSAGE_ROLE_AGENT");

  ASSERT_EQ(req.selected_tools.size(), 2u);
  EXPECT_EQ(req.selected_tools[0].tool_name, "hangUp");
  EXPECT_EQ(req.selected_tools[1].tool_id, "t-1");
  EXPECT_EQ(req.selected_tools[1].auth_tokens.at("token"), "abc");

  ASSERT_TRUE(req.data_connection.has_value());
  EXPECT_EQ(req.data_connection->websocket_url, "wss://data.example/feed");
  EXPECT_EQ(req.data_connection->sample_rate, 0);
  EXPECT_EQ(req.data_connection->channel_mode, "CHANNEL_MODE_SEPARATED");
}

TEST(Service, ExternalVoiceNeedsProvider) {
  auto result = toml::parse(R"(
    [voice.external_voice]
    voice_id = "orphan"

    [voice.data_connection]
    sample_rate = 8000
  )");

  ASSERT_TRUE(result);
  const auto req = Service::make_request(conf::token("voice", result.table()));

  EXPECT_FALSE(req.external_voice.has_value());
  EXPECT_EQ(req.voice, "Mark");
  EXPECT_FALSE(req.data_connection.has_value());
  EXPECT_TRUE(req.selected_tools.empty());
  EXPECT_TRUE(req.initial_messages.empty());
  EXPECT_FALSE(req.user_greeting.has_value());
}
