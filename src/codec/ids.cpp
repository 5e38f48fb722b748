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

#include "codec/ids.hpp"

#include <algorithm>
#include <cctype>

namespace parley {
namespace codec {

csv name(Codec c) noexcept {
  switch (c) {
  case Codec::PCMU:
    return "PCMU";
  case Codec::PCMA:
    return "PCMA";
  case Codec::Opus:
    return "opus";
  case Codec::None:
    break;
  }

  return "none";
}

Codec from_name(csv encoding) noexcept {
  string lc(encoding);
  std::transform(lc.begin(), lc.end(), lc.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lc == "pcmu") return Codec::PCMU;
  if (lc == "pcma") return Codec::PCMA;
  if (lc == "opus") return Codec::Opus;

  return Codec::None;
}

} // namespace codec
} // namespace parley
