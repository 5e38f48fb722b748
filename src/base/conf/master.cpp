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

#include "base/conf/master.hpp"
#include "base/conf/cli_args.hpp"
#include "base/conf/fixed.hpp"
#include "build_inject.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/format.h>

namespace parley {
namespace conf {

std::unique_ptr<master> mptr;

namespace fs = std::filesystem;

master::master(int argc, char *argv[]) noexcept {

  // first, parse the command line args
  cli_args cli(argc, argv);

  msgs[HelpMsg] = cli.help_msg();
  msgs[ArgsErrMsg] = cli.error_msg();

  // when there aren't any error messages proceed with parsing
  if (std::all_of(msgs.begin(), msgs.end(), [](const auto &m) { return m.empty(); })) {

    toml::table bt;
    bt.insert_or_assign(key::project, build::info.project);
    bt.insert_or_assign(key::version, build::info.version);
    bt.insert_or_assign(key::git_describe, build::info.git);
    bt.insert_or_assign(key::sysconf_dir, build::info.sysconf_dir.string());

    // populate the cli args and build info before parsing
    ttable.insert_or_assign(root::cli, cli_args::table());
    ttable.insert_or_assign(root::build, std::move(bt));

    parse();
  }
}

void master::copy_to(csv root, toml::table &dest) noexcept {
  dest = toml::table();

  if (mptr) {
    if (const auto *t = mptr->ttable[root].as_table(); t != nullptr) dest = *t;
  }
}

const string &master::get_first_msg() const noexcept {

  static const string empty{"no first message"};

  auto it = std::find_if(msgs.begin(), msgs.end(), [](auto &m) { return !m.empty(); });

  if (it < msgs.end()) return *it;

  return empty;
}

void master::parse() noexcept {
  const fs::path cff_path{fixed::cfg_file()};

  if (!fs::exists(cff_path)) {
    // a missing config file is not fatal, module defaults apply
    msgs[InitMsg] = fmt::format("{} not found, using defaults", cff_path.string());
    return;
  }

  auto pt_result = toml::parse_file(cff_path.string());

  if (pt_result) {
    // merge the parsed config to our local table
    pt_result.table().for_each(
        [this](const toml::key &key, auto &&val) { ttable.insert_or_assign(key, std::move(val)); });

    msgs[InitMsg] = fmt::format("{} parsed, tables={}", cff_path.string(), ttable.size());

  } else {
    const auto &error = pt_result.error();
    const auto &src = error.source().begin;

    msgs[ParseMsg] = fmt::format("{} parse failed at line {} column {}: {}", cff_path.string(),
                                 src.line, src.column, error.description());
  }
}

} // namespace conf
} // namespace parley
