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

#pragma once

#include "base/asio.hpp"
#include "base/types.hpp"
#include "voice/duration.hpp"

#include <fmt/format.h>
#include <map>
#include <optional>
#include <vector>

namespace parley {
namespace voice {

/// @brief Message spoken after a period of user inactivity
struct TimedMessage {
  Duration duration;
  string message;
  string end_behavior; // e.g. END_BEHAVIOR_HANG_UP_SOFT
};

/// @brief Server websocket medium, the voice service streams raw PCM
struct WebSocketMedium {
  int input_sample_rate{8000};
  int output_sample_rate{0};
  int client_buffer_size_ms{0};
};

/// @brief What the agent does when it speaks first
struct AgentGreeting {
  bool uninterruptible{false};
  string text;
  string prompt;
  Duration delay;
};

/// @brief The user speaks first.  A fallback agent greeting follows when
///        the user stays silent for the delay.
struct UserGreeting {
  Duration fallback_delay; // zero disables the fallback
  string fallback_text;
  string fallback_prompt;
};

/// @brief Message seeding the conversation before the call starts
struct InitialMessage {
  string role; // MESSAGE_ROLE_USER or MESSAGE_ROLE_AGENT
  string text;
};

/// @brief A tool the agent may use during the call, by id or by name
struct SelectedTool {
  string tool_id;
  string tool_name;
  string name_override;
  string description_override;
  std::map<string, string> auth_tokens;
};

/// @brief Voice of an external provider, used in place of a named voice
struct ExternalVoice {
  string provider; // elevenLabs, cartesia, playHt, lmnt or generic
  string voice_id;
  string model;
  double speed{0};
  string user_id; // playHt
  string url;     // generic
};

/// @brief Websocket the service streams call audio and data messages to
struct DataConnection {
  string websocket_url;
  int sample_rate{0};
  string channel_mode; // e.g. CHANNEL_MODE_SEPARATED
};

/// @brief Voice activity detection tuning
struct VadSettings {
  Duration turn_endpoint_delay;
  Duration minimum_turn_duration;
  Duration minimum_interruption_duration;
  double frame_activation_threshold{0};
};

/// @brief Parameters of a voice call.  Empty fields are left out of
///        the request body and the service applies its own default.
struct CallRequest {
  string system_prompt;
  double temperature{0};
  string model;
  string voice; // left out when an external voice is present
  std::optional<ExternalVoice> external_voice;
  string language_hint;
  std::vector<InitialMessage> initial_messages;
  Duration join_timeout;
  Duration max_duration;
  string time_exceeded_message;
  std::vector<TimedMessage> inactivity_messages;
  std::optional<WebSocketMedium> medium;
  bool recording_enabled{false};
  string first_speaker;
  string initial_output_medium;
  std::optional<AgentGreeting> agent_greeting;
  std::optional<UserGreeting> user_greeting; // takes precedence over agent_greeting
  std::optional<VadSettings> vad;
  std::map<string, string> metadata;
  std::vector<SelectedTool> selected_tools;
  std::optional<DataConnection> data_connection;

  // query parameters, not part of the body
  string prior_call_id;
  bool enable_greeting_prompt{false};

  // selects the agent endpoint, not part of the body
  string agent_id;

  /// @brief Request body
  /// @return json text
  string to_json() const noexcept;

  /// @brief Endpoint for creating this call, including query parameters
  /// @param api_base base url of the service api (e.g. https://host/api)
  /// @return url
  string url(csv api_base) const noexcept;
};

/// @brief Call returned by the voice service
struct Call {
  string call_id;
  string client_version;
  string join_url;
  string created;
  string joined;
  string ended;
  string end_reason;
  Duration max_duration;
  Duration join_timeout;
  bool recording_enabled{false};
  int error_count{0};
  string short_summary;
  string summary;

  /// @brief Populate a Call from a response body
  /// @param text response body
  /// @param call populated call
  /// @return error_code, call_create_failed when the body is not a
  ///         json object or does not provide a join url
  static error_code parse(csv text, Call &call) noexcept;
};

} // namespace voice
} // namespace parley

template <> struct fmt::formatter<parley::voice::Call> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const parley::voice::Call &c, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "call_id={} join_url={}", c.call_id, c.join_url);
  }
};
