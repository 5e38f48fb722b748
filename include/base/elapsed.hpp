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

#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <compare>
#include <cstdint>
#include <type_traits>

namespace parley {

/// @brief Small footprint, lightweight class to measure the passage of time
///        since object construction
class Elapsed {
public:
  Elapsed(void) noexcept : nanos(monotonic()), frozen(false) {}

  /// @brief function object to return elapsed duration as the
  ///        default precision
  /// @return Nanos
  Nanos operator()() const noexcept { return elapsed(); }

  /// @brief return the elapsed duration as an explicit type
  /// @tparam TO requested return type
  /// @return elapsed duration as requested type
  template <typename TO> inline TO as() const noexcept {
    if constexpr (std::same_as<TO, Nanos>) {
      return elapsed();
    } else if constexpr (IsDuration<TO>) {
      return std::chrono::duration_cast<TO>(elapsed());
    } else if constexpr (std::signed_integral<TO>) {
      return elapsed().count();
    } else {
      static_assert(AlwaysFalse<TO>, "unsupported type");
      return 0;
    }
  }

  /// @brief Freeze the elapsed duration
  /// @return elapsed duration as std::chrono::nanoseconds
  Nanos freeze() noexcept {
    nanos = elapsed();
    frozen = true;
    return nanos;
  }

  /// @brief Create a humanized (e.g. 1m 20s 3.1ms) string of the elapsed duration
  /// @return const string
  const string humanize() const noexcept;

  /// @brief Reset the elapsed duration
  /// @return true (for use in if statements)
  bool reset() noexcept {
    *this = Elapsed();
    return true;
  }

private:
  static Nanos monotonic() noexcept;
  Nanos elapsed() const noexcept { return frozen ? nanos : monotonic() - nanos; }

private:
  Nanos nanos;
  bool frozen;
};

} // namespace parley
