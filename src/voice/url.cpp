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

#include "voice/url.hpp"

#include <algorithm>
#include <cctype>

namespace parley {
namespace voice {

static constexpr csv SEP{"://"};

bool Url::parse(csv text, Url &url) noexcept {
  const auto sep = text.find(SEP);
  if (sep == csv::npos) return false;

  url.scheme = string(text.substr(0, sep));
  std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  string def_port;
  if ((url.scheme == "https") || (url.scheme == "wss")) {
    def_port = "443";
  } else if ((url.scheme == "http") || (url.scheme == "ws")) {
    def_port = "80";
  } else {
    return false;
  }

  csv rest = text.substr(sep + SEP.size());

  const auto slash = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, slash);

  if (slash == csv::npos) {
    url.target = "/";
  } else if (rest[slash] == '?') {
    url.target = fmt::format("/{}", rest.substr(slash));
  } else {
    url.target = string(rest.substr(slash));
  }

  // drop userinfo
  if (const auto at = authority.rfind('@'); at != csv::npos) authority.remove_prefix(at + 1);

  // bracketed ipv6 literal
  if (!authority.empty() && (authority.front() == '[')) {
    const auto close = authority.find(']');
    if (close == csv::npos) return false;

    url.host = string(authority.substr(1, close - 1));
    csv after = authority.substr(close + 1);
    url.port = (after.size() > 1) && (after.front() == ':') ? string(after.substr(1)) : def_port;

  } else if (const auto colon = authority.rfind(':'); colon != csv::npos) {
    url.host = string(authority.substr(0, colon));
    url.port = string(authority.substr(colon + 1));

    if (url.port.empty()) url.port = def_port;
  } else {
    url.host = string(authority);
    url.port = def_port;
  }

  if (!std::all_of(url.port.begin(), url.port.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    return false;
  }

  return !url.host.empty();
}

string Url::host_header() const noexcept {
  const bool def_port = secure() ? (port == "443") : (port == "80");

  return def_port ? host : fmt::format("{}:{}", host, port);
}

} // namespace voice
} // namespace parley
