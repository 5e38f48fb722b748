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

#include "voice/duration.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace parley {
namespace voice {

// longest units first so "ms" is not taken as "m"
static constexpr std::array<std::pair<csv, double>, 7> units{{
    {"ns", 1.0},
    {"us", 1e3},
    {"µs", 1e3},
    {"ms", 1e6},
    {"s", 1e9},
    {"m", 60e9},
    {"h", 3600e9},
}};

static bool parse_number(csv text, size_t &pos, double &val) noexcept {
  const auto start = pos;

  while ((pos < text.size()) && (std::isdigit(static_cast<unsigned char>(text[pos])) ||
                                 (text[pos] == '.'))) {
    pos++;
  }

  if (pos == start) return false;

  const string num(text.substr(start, pos - start));
  char *end = nullptr;
  val = std::strtod(num.c_str(), &end);

  return (end != nullptr) && (*end == '\0');
}

bool Duration::parse(csv raw, Duration &d) noexcept {
  if (raw.empty()) return false;

  std::string_view text = raw;
  double sign = 1.0;

  if ((text.front() == '-') || (text.front() == '+')) {
    sign = (text.front() == '-') ? -1.0 : 1.0;
    text.remove_prefix(1);
  }

  // plain number of seconds
  size_t pos = 0;
  double val = 0;

  if (parse_number(text, pos, val) && (pos == text.size())) {
    d = from_seconds(sign * val);
    return true;
  }

  double total_ns = 0;
  pos = 0;

  while (pos < text.size()) {
    if (!parse_number(text, pos, val)) return false;

    auto it = std::find_if(units.begin(), units.end(), [&](const auto &u) {
      return text.substr(pos, u.first.size()) == u.first;
    });

    if (it == units.end()) return false;

    total_ns += val * it->second;
    pos += it->first.size();
  }

  d = Duration(Nanos(static_cast<int64_t>(std::llround(sign * total_ns))));

  return true;
}

string Duration::to_string() const noexcept {
  const auto secs = seconds();

  if (secs == std::trunc(secs)) return fmt::format("{:.0f}s", secs);

  return fmt::format("{:g}s", secs);
}

} // namespace voice
} // namespace parley
