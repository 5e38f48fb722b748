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

#include "base/elapsed.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <iterator>
#include <time.h>

namespace parley {

Nanos Elapsed::monotonic() noexcept {
  struct timespec tn;
  clock_gettime(CLOCK_MONOTONIC_RAW, &tn);

  return Seconds(tn.tv_sec) + Nanos(tn.tv_nsec);
}

const string Elapsed::humanize() const noexcept {
  string msg;
  auto w = std::back_inserter(msg);
  auto d = elapsed();

  if (auto x = parley::as<Minutes>(d); x != Minutes::zero()) {
    fmt::format_to(w, "{} ", x);
    d -= x;
  }

  if (auto x = parley::as<Seconds>(d); x != Seconds::zero()) {
    fmt::format_to(w, "{} ", x);
    d -= x;
  }

  fmt::format_to(w, "{:.1}", parley::as<millis_fp>(d));

  return msg;
}

} // namespace parley
