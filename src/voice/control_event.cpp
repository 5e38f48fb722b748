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

#include "voice/control_event.hpp"
#include "base/error.hpp"
#include "base/json.hpp"

#include <ArduinoJson.h>

namespace parley {
namespace voice {

static constexpr csv TYPE{"type"};

static string str_field(JsonObjectConst obj, const char *key) noexcept {
  const char *v = obj[key] | "";

  return string(v);
}

error_code ControlEvent::parse(csv text, ControlEvent &ev) noexcept {
  DynamicJsonDocument doc(json::capacity(text));

  // only text that is not json is malformed, dense json grows the pool
  if (auto jerr = json::parse(text, doc); jerr) {
    return make_error_code(err::malformed_control);
  }

  JsonObjectConst obj = doc.as<JsonObjectConst>();
  if (obj.isNull() || !obj[TYPE.data()].is<const char *>()) {
    return make_error_code(err::malformed_control);
  }

  ev.kind = obj[TYPE.data()].as<const char *>();

  if (ev.kind == "transcript") {
    ev.event = Transcript{.role = str_field(obj, "role"),
                          .final = obj["final"] | false,
                          .text = str_field(obj, "text"),
                          .delta = str_field(obj, "delta")};

  } else if (ev.kind == "error") {
    ev.event = Error{.error = str_field(obj, "error")};

  } else if (ev.kind == "state") {
    ev.event = State{.state = str_field(obj, "state")};

  } else {
    ev.event = Unknown{.raw = string(text)};
  }

  return error_code();
}

} // namespace voice
} // namespace parley
