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

#include "base/conf/fixed.hpp"
#include "base/conf/cli_args.hpp"
#include "base/conf/keys.hpp"
#include "build_inject.hpp"

namespace parley {
namespace conf {

using fs_path = std::filesystem::path;

csv fixed::app_name() noexcept { return build::info.project; }

string fixed::cfg_file() noexcept { return cli_args::ttable[key::cfg_file].value_or(string()); }

string fixed::git() noexcept { return build::info.git; }

fs_path fixed::log_file() noexcept { return cli_args::ttable[key::log_file].value_or(string()); }

string fixed::version() noexcept { return build::info.version; }

} // namespace conf
} // namespace parley
