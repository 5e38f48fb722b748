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

#include "voice/service.hpp"
#include "base/logger.hpp"
#include "voice/ws_channel.hpp"

namespace parley {
namespace voice {

static constexpr csv DEF_SYSTEM_PROMPT{
    "You are a helpful assistant. Provide concise, helpful information to user queries. "
    "Be warm and friendly but brief in your responses."};

static constexpr csv DEF_GREETING{"Hello! How can I assist you today?"};

static Duration dura_val(const conf::token &tokc, csv key, Duration def_val) noexcept {
  const auto node = tokc.table()[key];

  if (auto s = node.value<string>(); s) {
    if (Duration d; Duration::parse(*s, d)) return d;

    log_info(Service::module_id, "config"sv, "invalid duration {}={}, using {}", key, *s, def_val);
    return def_val;
  }

  if (auto secs = node.value<double>(); secs) return Duration::from_seconds(*secs);

  return def_val;
}

static std::vector<TimedMessage> inactivity_messages(const conf::token &tokc) noexcept {
  const auto *arr = tokc.table()["inactivity_messages"].as_array();

  if (arr == nullptr) {
    return std::vector<TimedMessage>{
        {5s, "Are you still there? I'm here to help if you need anything.",
         "END_BEHAVIOR_UNSPECIFIED"},
        {15s, "I'll wait a bit longer in case you want to continue our conversation.",
         "END_BEHAVIOR_UNSPECIFIED"},
        {20s,
         "Since I haven't heard from you, I'll be ending our call now. Feel free to call back "
         "anytime if you need assistance!",
         "END_BEHAVIOR_HANG_UP_SOFT"}};
  }

  std::vector<TimedMessage> msgs;

  for (const auto &el : *arr) {
    const auto *tbl = el.as_table();
    if (tbl == nullptr) continue;

    conf::token msg_tok("msg", toml::table{{"msg", *tbl}});

    msgs.emplace_back(TimedMessage{
        .duration = dura_val(msg_tok, "duration", Duration()),
        .message = msg_tok.val("message", ""),
        .end_behavior = msg_tok.val("end_behavior", "END_BEHAVIOR_UNSPECIFIED")});
  }

  return msgs;
}

// token over one element of an array of tables
static conf::token el_token(const toml::table &tbl) noexcept {
  return conf::token("el", toml::table{{"el", tbl}});
}

static std::map<string, string> str_map(const toml::table *tbl) noexcept {
  std::map<string, string> m;

  if (tbl != nullptr) {
    for (const auto &[k, v] : *tbl) {
      if (auto s = v.value<string>(); s) m.emplace(string(k.str()), std::move(*s));
    }
  }

  return m;
}

static std::vector<InitialMessage> initial_messages(const conf::token &tokc) noexcept {
  std::vector<InitialMessage> msgs;

  if (const auto *arr = tokc.table()["initial_messages"].as_array(); arr != nullptr) {
    for (const auto &el : *arr) {
      if (const auto *tbl = el.as_table(); tbl != nullptr) {
        const auto msg_tok = el_token(*tbl);

        msgs.emplace_back(InitialMessage{.role = msg_tok.val("role", "MESSAGE_ROLE_USER"),
                                         .text = msg_tok.val("text", "")});
      }
    }
  }

  return msgs;
}

static std::vector<SelectedTool> selected_tools(const conf::token &tokc) noexcept {
  std::vector<SelectedTool> tools;

  const auto *arr = tokc.table()["selected_tools"].as_array();
  if (arr == nullptr) return tools;

  for (const auto &el : *arr) {
    const auto *tbl = el.as_table();
    if (tbl == nullptr) continue;

    const auto tool_tok = el_token(*tbl);
    SelectedTool tool{.tool_id = tool_tok.val("tool_id", ""),
                      .tool_name = tool_tok.val("tool_name", ""),
                      .name_override = tool_tok.val("name_override", ""),
                      .description_override = tool_tok.val("description_override", ""),
                      .auth_tokens = str_map((*tbl)["auth_tokens"].as_table())};

    if (tool.tool_id.empty() && tool.tool_name.empty()) {
      log_info(Service::module_id, "config"sv, "selected tool without tool_id or tool_name");
      continue;
    }

    tools.emplace_back(std::move(tool));
  }

  return tools;
}

CallRequest Service::make_request(const conf::token &tokc) noexcept {
  CallRequest r;

  r.system_prompt = tokc.val<string>("system_prompt", string(DEF_SYSTEM_PROMPT));
  r.temperature = tokc.val<double>("temperature", 0.0);
  r.model = tokc.val("model", "fixie-ai/ultravox");
  r.voice = tokc.val("voice", "Mark");
  r.language_hint = tokc.val("language_hint", "");
  r.initial_messages = initial_messages(tokc);

  if (const auto *tbl = tokc.table()["external_voice"].as_table(); tbl != nullptr) {
    const auto ev_tok = el_token(*tbl);

    if (auto provider = ev_tok.val("provider", ""); !provider.empty()) {
      r.external_voice = ExternalVoice{.provider = std::move(provider),
                                       .voice_id = ev_tok.val("voice_id", ""),
                                       .model = ev_tok.val("model", ""),
                                       .speed = ev_tok.val<double>("speed", 0.0),
                                       .user_id = ev_tok.val("user_id", ""),
                                       .url = ev_tok.val("url", "")};
    } else {
      log_info(Service::module_id, "config"sv, "external_voice without provider, voice={}",
               r.voice);
    }
  }

  r.join_timeout = dura_val(tokc, "join_timeout", 30s);
  r.max_duration = dura_val(tokc, "max_duration", 5min);
  r.time_exceeded_message = tokc.val("time_exceeded_message", "");
  r.inactivity_messages = inactivity_messages(tokc);
  r.recording_enabled = tokc.val<bool>("recording_enabled", false);
  r.initial_output_medium = tokc.val("initial_output_medium", "MESSAGE_MEDIUM_VOICE");

  r.medium = WebSocketMedium{
      .input_sample_rate = tokc.val<int>("input_sample_rate", 8000),
      .output_sample_rate = tokc.val<int>("output_sample_rate", 8000),
      .client_buffer_size_ms = tokc.val<int>("client_buffer_size_ms", 0)};

  if (tokc.val("first_speaker", "agent") == "user") {
    r.user_greeting =
        UserGreeting{.fallback_delay = dura_val(tokc, "user_fallback_delay", Duration()),
                     .fallback_text = tokc.val("user_fallback_text", ""),
                     .fallback_prompt = tokc.val("user_fallback_prompt", "")};
  } else if (auto text = tokc.val<string>("first_speaker_text", string(DEF_GREETING));
             !text.empty()) {
    r.agent_greeting = AgentGreeting{.text = std::move(text)};
  } else {
    r.first_speaker = "FIRST_SPEAKER_AGENT";
  }

  r.vad = VadSettings{.turn_endpoint_delay = dura_val(tokc, "turn_endpoint_delay", 400ms)};

  r.metadata = str_map(tokc.table()["metadata"].as_table());
  r.selected_tools = selected_tools(tokc);

  if (const auto *tbl = tokc.table()["data_connection"].as_table(); tbl != nullptr) {
    const auto dc_tok = el_token(*tbl);

    if (auto ws_url = dc_tok.val("websocket_url", ""); !ws_url.empty()) {
      r.data_connection = DataConnection{.websocket_url = std::move(ws_url),
                                         .sample_rate = dc_tok.val<int>("sample_rate", 0),
                                         .channel_mode = dc_tok.val("channel_mode", "")};
    }
  }

  r.prior_call_id = tokc.val("prior_call_id", "");
  r.enable_greeting_prompt = tokc.val<bool>("enable_greeting_prompt", false);
  r.agent_id = tokc.val("agent_id", "");

  return r;
}

Service::Service(conf::token tokc) noexcept
    : tokc(std::move(tokc)),                   //
      req(make_request(this->tokc)),           //
      client(Client::Opts{.api_key = this->tokc.val("api_key", ""),
                          .api_base = this->tokc.val<string>("api_base",
                                                             string(Client::DEFAULT_API_BASE)),
                          .timeout = this->tokc.timeout_val("http_timeout", 15s)}),
      dial_timeout(this->tokc.timeout_val("dial_timeout", WsChannel::DIAL_TIMEOUT)) {
  INFO_INIT("model={} voice={} api_base={} api_key={}", req.model, req.voice, client.api_base(),
            client.has_api_key() ? "present" : "missing");
}

error_code Service::create_call(Call &call, std::stop_token stoken) noexcept {
  return client.create_call(req, call, std::move(stoken));
}

std::unique_ptr<Channel> Service::make_channel() noexcept {
  return std::make_unique<WsChannel>(dial_timeout);
}

} // namespace voice
} // namespace parley
