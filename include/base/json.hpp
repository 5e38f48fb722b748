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

#include "base/types.hpp"

#include <ArduinoJson.h>
#include <algorithm>

namespace parley {
namespace json {

/// @brief Deserialize text into a document that grows until the text fits.
///        The initial pool is sized for typical text, dense arrays and
///        objects need more slots than their text length suggests.
/// @param text json text
/// @param doc replaced by a larger document on each retry
/// @return DeserializationError, NoMemory only when even the largest pool
///         (or an allocation) fails
inline DeserializationError parse(csv text, DynamicJsonDocument &doc) noexcept {
  // each value needs at most one slot and takes at least two bytes of text
  const size_t limit = text.size() * 32 + 1024;

  for (;;) {
    const auto jerr = deserializeJson(doc, text.data(), text.size());

    if ((jerr != DeserializationError::NoMemory) || (doc.capacity() == 0) ||
        (doc.capacity() >= limit)) {
      return jerr;
    }

    doc = DynamicJsonDocument(std::min(doc.capacity() * 2, limit));
  }
}

/// @brief Initial pool size for text
inline size_t capacity(csv text) noexcept { return std::max<size_t>(1024, text.size() * 3); }

} // namespace json
} // namespace parley
