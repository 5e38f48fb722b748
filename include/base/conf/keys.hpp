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

namespace parley {
namespace conf {

struct root {
  static constexpr auto cli{"cli"};
  static constexpr auto build{"build"};
};

struct key {
  static constexpr auto app_name{"app-name"};
  static constexpr auto cfg_file{"cfg-file"};
  static constexpr auto exec_dir{"exec-dir"};
  static constexpr auto git_describe{"git-describe"};
  static constexpr auto help{"help"};
  static constexpr auto log_file{"log-file"};
  static constexpr auto parent_dir{"parent-dir"};
  static constexpr auto project{"project"};
  static constexpr auto sysconf_dir{"sysconf-dir"};
  static constexpr auto version{"version"};
};

} // namespace conf
} // namespace parley
