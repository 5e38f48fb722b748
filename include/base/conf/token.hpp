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

#include "base/conf/toml.hpp"
#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <concepts>
#include <fmt/format.h>
#include <vector>

namespace parley {
namespace conf {

template <typename T>
concept IsConfVal =
    IsAnyOf<T, bool, string, double> || std::integral<T> || std::floating_point<T>;

/// @brief Provides access to configuration info using
///        the specified module id as the root.
///
///        conf::tokens are generally not used standalone.
///        Rather, they are member variables within an
///        object that requires access to the configuration
///        file.
///
///        The configuration data provided is current as of
///        the time of construction.
class token {
  friend struct fmt::formatter<token>;

public:
  /// @brief Create a default token (does not point to a configuration)
  token() = default;

  /// @brief Create config token populated with the subtable of the
  ///        master configuration at module id
  /// @param mid module_id (aka root)
  explicit token(csv mid) noexcept;

  /// @brief Create config token populated with the subtable at module id
  ///        of an explicitly provided table
  /// @param mid module id (aka root)
  /// @param src table containing the module subtable
  token(csv mid, const toml::table &src) noexcept;

  token(token &&other) = default;
  token &operator=(token &&) = default;

public:
  /// @brief Is the configuration provided by this token empty?
  /// @return boolean
  bool empty() const noexcept { return ttable.empty(); }

  /// @brief Direct access to configuration table managed by token.
  ///        Use for access to configuration not handled by member
  ///        functions (e.g. arrays of tables)
  /// @return const reference to the module table
  const toml::table &table() const noexcept { return ttable; }

  /// @brief Retrieve an array of strings located at path
  /// @param p path relative to the module root
  /// @return vector of strings (non-string elements are skipped)
  std::vector<string> strings(csv p) const noexcept;

  /// @brief Retrieve a "timeout" value from the config specified as:
  ///        gathering_timeout = { mins = 1, secs = 30, millis = 100 }
  /// @param p path to the config value
  /// @param def_val default duration
  /// @return std::chrono::milliseconds
  Millis timeout_val(csv p, Millis def_val) const noexcept;

  /// @brief Retrieve configuration value located at path
  /// @tparam T Desired type of the returned value
  /// @param p Path to value, excluding root (a.k.a. module_id)
  /// @param def_val Default value if no value found at specified path
  /// @return value of type T at specified path or provided default value
  template <typename T>
    requires IsConfVal<T>
  T val(csv p, T def_val) const noexcept {
    const auto node = ttable.at_path(p);

    if constexpr (std::same_as<T, string>) {
      return node.template value<string>().value_or(std::move(def_val));
    } else if constexpr (std::same_as<T, bool>) {
      return node.template value<bool>().value_or(def_val);
    } else if constexpr (std::integral<T>) {
      return static_cast<T>(node.template value<int64_t>().value_or(def_val));
    } else {
      return static_cast<T>(node.template value<double>().value_or(def_val));
    }
  }

  string val(csv p, const char *def_val) const noexcept { return val<string>(p, string(def_val)); }

public:
  // order dependent
  string root;

private:
  toml::table ttable;
};

} // namespace conf
} // namespace parley

template <> struct fmt::formatter<parley::conf::token> : formatter<std::string> {
  template <typename FormatContext>
  auto format(const parley::conf::token &tok, FormatContext &ctx) const -> decltype(ctx.out()) {
    return formatter<std::string>::format(
        fmt::format("root={} keys={}", tok.root, tok.ttable.size()), ctx);
  }
};
