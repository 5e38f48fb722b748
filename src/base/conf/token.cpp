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

#include "base/conf/token.hpp"
#include "base/conf/master.hpp"

namespace parley {
namespace conf {

token::token(csv mid) noexcept : root{mid} { master::copy_to(mid, ttable); }

token::token(csv mid, const toml::table &src) noexcept : root{mid} {
  if (const auto *t = src[mid].as_table(); t != nullptr) ttable = *t;
}

std::vector<string> token::strings(csv p) const noexcept {
  std::vector<string> list;

  if (const auto *arr = ttable.at_path(p).as_array(); arr != nullptr) {
    for (const auto &el : *arr) {
      if (auto s = el.value<string>(); s) list.emplace_back(std::move(*s));
    }
  }

  return list;
}

Millis token::timeout_val(csv p, Millis def_val) const noexcept {
  const auto *timeout_table = ttable.at_path(p).as_table();

  if (timeout_table == nullptr) return def_val;

  Millis sum_ms{0};

  timeout_table->for_each([&sum_ms](const toml::key &key, const toml::value<int64_t> &val) {
    const int64_t v = val.get();

    if ((key == "minutes"sv) || (key == "mins"sv)) {
      sum_ms += Minutes{v};
    } else if ((key == "seconds"sv) || (key == "secs"sv)) {
      sum_ms += Seconds{v};
    } else if ((key == "millis"sv) || (key == "ms"sv)) {
      sum_ms += Millis{v};
    }
  });

  return sum_ms;
}

} // namespace conf
} // namespace parley
