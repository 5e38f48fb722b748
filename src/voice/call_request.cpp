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

#include "voice/call_request.hpp"
#include "base/error.hpp"
#include "base/json.hpp"

#include <ArduinoJson.h>
#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <vector>

namespace parley {
namespace voice {

// strings are copied into the document, reserve room for them
static size_t doc_size(const CallRequest &r) noexcept {
  size_t n = 2048 + r.system_prompt.size() + r.time_exceeded_message.size();

  for (const auto &m : r.inactivity_messages) {
    n += 128 + m.message.size() + m.end_behavior.size();
  }

  if (r.agent_greeting.has_value()) {
    n += r.agent_greeting->text.size() + r.agent_greeting->prompt.size();
  }

  if (r.user_greeting.has_value()) {
    n += r.user_greeting->fallback_text.size() + r.user_greeting->fallback_prompt.size();
  }

  for (const auto &[k, v] : r.metadata) {
    n += 64 + k.size() + v.size();
  }

  for (const auto &m : r.initial_messages) {
    n += 64 + m.role.size() + m.text.size();
  }

  for (const auto &t : r.selected_tools) {
    n += 128 + t.tool_id.size() + t.tool_name.size() + t.name_override.size() +
         t.description_override.size();

    for (const auto &[k, v] : t.auth_tokens) {
      n += 64 + k.size() + v.size();
    }
  }

  if (r.external_voice.has_value()) {
    const auto &ev = r.external_voice.value();
    n += 128 + ev.provider.size() + ev.voice_id.size() + ev.model.size() + ev.user_id.size() +
         ev.url.size();
  }

  if (r.data_connection.has_value()) n += 128 + r.data_connection->websocket_url.size();

  return n * 2;
}

static void put_str(JsonObject obj, const char *key, const string &val) noexcept {
  if (!val.empty()) obj[key] = val;
}

static void put_dura(JsonObject obj, const char *key, const Duration &val) noexcept {
  if (!val.zero()) obj[key] = val.to_string();
}

static string escape(csv raw) noexcept {
  string out;

  for (const auto c : raw) {
    const auto uc = static_cast<unsigned char>(c);

    if (std::isalnum(uc) || (c == '-') || (c == '_') || (c == '.') || (c == '~')) {
      out.push_back(c);
    } else {
      fmt::format_to(std::back_inserter(out), "%{:02X}", uc);
    }
  }

  return out;
}

string CallRequest::to_json() const noexcept {
  DynamicJsonDocument doc(doc_size(*this));
  JsonObject root = doc.to<JsonObject>();

  put_str(root, "systemPrompt", system_prompt);
  if (temperature != 0) root["temperature"] = temperature;
  put_str(root, "model", model);

  if (external_voice.has_value()) {
    const auto &ev = external_voice.value();
    JsonObject obj = root.createNestedObject("externalVoice").createNestedObject(ev.provider);

    put_str(obj, "voiceId", ev.voice_id);
    put_str(obj, "model", ev.model);
    if (ev.speed != 0) obj["speed"] = ev.speed;
    put_str(obj, "userId", ev.user_id);
    put_str(obj, "url", ev.url);
  } else {
    put_str(root, "voice", voice);
  }

  put_str(root, "languageHint", language_hint);

  if (!initial_messages.empty()) {
    JsonArray msgs = root.createNestedArray("initialMessages");

    for (const auto &m : initial_messages) {
      JsonObject obj = msgs.createNestedObject();

      put_str(obj, "role", m.role);
      put_str(obj, "text", m.text);
    }
  }

  put_dura(root, "joinTimeout", join_timeout);
  put_dura(root, "maxDuration", max_duration);
  put_str(root, "timeExceededMessage", time_exceeded_message);

  if (!inactivity_messages.empty()) {
    JsonArray msgs = root.createNestedArray("inactivityMessages");

    for (const auto &m : inactivity_messages) {
      JsonObject obj = msgs.createNestedObject();

      put_dura(obj, "duration", m.duration);
      put_str(obj, "message", m.message);
      put_str(obj, "endBehavior", m.end_behavior);
    }
  }

  if (medium.has_value()) {
    JsonObject sws = root.createNestedObject("medium").createNestedObject("serverWebSocket");

    sws["inputSampleRate"] = medium->input_sample_rate;
    if (medium->output_sample_rate) sws["outputSampleRate"] = medium->output_sample_rate;
    if (medium->client_buffer_size_ms) sws["clientBufferSizeMs"] = medium->client_buffer_size_ms;
  }

  if (recording_enabled) root["recordingEnabled"] = true;
  put_str(root, "firstSpeaker", first_speaker);
  put_str(root, "initialOutputMedium", initial_output_medium);

  if (user_greeting.has_value()) {
    JsonObject user = root.createNestedObject("firstSpeakerSettings").createNestedObject("user");
    const auto &ug = user_greeting.value();

    if (!ug.fallback_delay.zero()) {
      JsonObject fallback = user.createNestedObject("fallback");

      put_dura(fallback, "delay", ug.fallback_delay);
      put_str(fallback, "text", ug.fallback_text);
      put_str(fallback, "prompt", ug.fallback_prompt);
    }

  } else if (agent_greeting.has_value()) {
    JsonObject agent = root.createNestedObject("firstSpeakerSettings").createNestedObject("agent");
    const auto &ag = agent_greeting.value();

    if (ag.uninterruptible) agent["uninterruptible"] = true;
    put_str(agent, "text", ag.text);
    put_str(agent, "prompt", ag.prompt);
    put_dura(agent, "delay", ag.delay);
  }

  if (vad.has_value()) {
    JsonObject obj = root.createNestedObject("vadSettings");

    put_dura(obj, "turnEndpointDelay", vad->turn_endpoint_delay);
    put_dura(obj, "minimumTurnDuration", vad->minimum_turn_duration);
    put_dura(obj, "minimumInterruptionDuration", vad->minimum_interruption_duration);
    if (vad->frame_activation_threshold != 0) {
      obj["frameActivationThreshold"] = vad->frame_activation_threshold;
    }
  }

  if (!metadata.empty()) {
    JsonObject obj = root.createNestedObject("metadata");

    for (const auto &[k, v] : metadata) {
      obj[k] = v;
    }
  }

  if (!selected_tools.empty()) {
    JsonArray tools = root.createNestedArray("selectedTools");

    for (const auto &t : selected_tools) {
      JsonObject obj = tools.createNestedObject();

      put_str(obj, "toolId", t.tool_id);
      put_str(obj, "toolName", t.tool_name);
      put_str(obj, "nameOverride", t.name_override);
      put_str(obj, "descriptionOverride", t.description_override);

      if (!t.auth_tokens.empty()) {
        JsonObject tokens = obj.createNestedObject("authTokens");

        for (const auto &[k, v] : t.auth_tokens) {
          tokens[k] = v;
        }
      }
    }
  }

  if (data_connection.has_value()) {
    const auto &dc = data_connection.value();
    JsonObject obj = root.createNestedObject("dataConnection");

    obj["websocketUrl"] = dc.websocket_url;

    if (dc.sample_rate || !dc.channel_mode.empty()) {
      JsonObject audio = obj.createNestedObject("audioConfig");

      if (dc.sample_rate) audio["sampleRate"] = dc.sample_rate;
      put_str(audio, "channelMode", dc.channel_mode);
    }
  }

  string json;
  serializeJson(doc, json);

  return json;
}

string CallRequest::url(csv api_base) const noexcept {
  csv base = api_base;
  while (!base.empty() && (base.back() == '/')) {
    base.remove_suffix(1);
  }

  string url = agent_id.empty() ? fmt::format("{}/calls", base)
                                : fmt::format("{}/agents/{}/calls", base, escape(agent_id));

  std::vector<string> params;
  if (enable_greeting_prompt) params.emplace_back("enableGreetingPrompt=true");
  if (!prior_call_id.empty()) params.emplace_back(fmt::format("priorCallId={}", escape(prior_call_id)));

  if (!params.empty()) fmt::format_to(std::back_inserter(url), "?{}", fmt::join(params, "&"));

  return url;
}

static Duration dura_field(JsonVariantConst v) noexcept {
  Duration d;

  if (v.is<const char *>()) {
    Duration::parse(v.as<const char *>(), d);
  } else if (v.is<double>() || v.is<int64_t>()) {
    d = Duration::from_seconds(v.as<double>());
  }

  return d;
}

static string str_field(JsonObjectConst obj, const char *key) noexcept {
  const char *v = obj[key] | "";

  return string(v);
}

error_code Call::parse(csv text, Call &call) noexcept {
  DynamicJsonDocument doc(json::capacity(text));

  if (auto jerr = json::parse(text, doc); jerr) {
    return make_error_code(err::call_create_failed);
  }

  JsonObjectConst obj = doc.as<JsonObjectConst>();
  if (obj.isNull()) return make_error_code(err::call_create_failed);

  call.call_id = str_field(obj, "callId");
  call.client_version = str_field(obj, "clientVersion");
  call.join_url = str_field(obj, "joinUrl");
  call.created = str_field(obj, "created");
  call.joined = str_field(obj, "joined");
  call.ended = str_field(obj, "ended");
  call.end_reason = str_field(obj, "endReason");
  call.max_duration = dura_field(obj["maxDuration"]);
  call.join_timeout = dura_field(obj["joinTimeout"]);
  call.recording_enabled = obj["recordingEnabled"] | false;
  call.error_count = obj["errorCount"] | 0;
  call.short_summary = str_field(obj, "shortSummary");
  call.summary = str_field(obj, "summary");

  if (call.join_url.empty()) return make_error_code(err::call_create_failed);

  return error_code();
}

} // namespace voice
} // namespace parley
