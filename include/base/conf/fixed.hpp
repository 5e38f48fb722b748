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

#include <filesystem>

namespace parley {
namespace conf {

/// @brief Helper class for access to global cli args, build and
///        runtime configuration.
///
///        **NOTE** Information only available after creation of cli_args static class
struct fixed {

  using fs_path = std::filesystem::path;

  /// @brief Application name from CMakeList project definition (e.g. parley)
  /// @return constant string view
  static csv app_name() noexcept;

  /// @brief Full path and filename of the configuration file as determined
  ///        based on cli args (or default).
  /// @return modifiable string copy
  static string cfg_file() noexcept;

  /// @brief Git describe as determined at build time
  /// @return string
  static string git() noexcept;

  /// @brief Log file path determined using cli args, empty for stdout
  /// @return modifiable std::filesystem::path
  static fs_path log_file() noexcept;

  /// @brief Project version from CMakeList project definition
  /// @return string
  static string version() noexcept;
};

} // namespace conf
} // namespace parley
