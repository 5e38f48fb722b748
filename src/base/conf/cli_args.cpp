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

#include "base/conf/cli_args.hpp"
#include "base/conf/keys.hpp"
#include "build_inject.hpp"

#include <boost/program_options.hpp>
#include <filesystem>
#include <fmt/format.h>

namespace parley {
namespace conf {

namespace po = boost::program_options;
namespace fs = std::filesystem;

using fs_path = fs::path;

constexpr auto def_cfg_toml_file{"live.toml"};
static const string def_log_file{""};

constexpr auto desc_cfg_file{"toml configuration file (relative to sysconf dir)"};
constexpr auto desc_help{"command line help"};
constexpr auto desc_log_file{"full path to log file (default stdout)"};
constexpr auto opt_help{"help"};

// class static data
toml::table cli_args::ttable;
string cli_args::error_str;
bool cli_args::help_requested{false};
std::ostringstream cli_args::help_ss;

cli_args::cli_args(int argc, char **argv) noexcept {
  // there will only ever be a single collection of cli args per invocation
  po::options_description desc(build::info.project);
  po::variables_map args;

  // get some base info and place into toml table
  fs_path fs_arg0{argv[0]};

  // note: order dependent, remove_filename modifies fs_arg0
  ttable.insert_or_assign(key::app_name, fs_arg0.filename().string());
  ttable.insert_or_assign(key::parent_dir, fs_arg0.parent_path().string());
  ttable.insert_or_assign(key::exec_dir, fs_arg0.remove_filename().string());

  const auto sysconf_dir = fs_path(build::info.sysconf_dir).append(build::info.project);
  const auto def_cfg_fs_file = fs_path(sysconf_dir).append(def_cfg_toml_file);

  auto cfg_file_v = po::value<string>()
                        ->notifier([&sysconf_dir](const string p) {
                          fs_path p_fs(p);

                          if (p_fs.is_absolute()) {
                            ttable.insert_or_assign(key::cfg_file, p);
                          } else {
                            ttable.insert_or_assign(key::cfg_file,
                                                    fs_path(sysconf_dir).append(p).string());
                          }
                        })
                        ->default_value(def_cfg_fs_file.string());

  auto log_file_v = po::value<string>()
                        ->notifier([](const string f) { ttable.insert_or_assign(key::log_file, f); })
                        ->default_value(def_log_file);

  auto help_v = po::bool_switch()
                    ->notifier([](bool e) { ttable.insert_or_assign(key::help, e); })
                    ->default_value(false);

  desc.add_options()                             //
      (key::cfg_file, cfg_file_v, desc_cfg_file) //
      (key::log_file, log_file_v, desc_log_file) //
      (opt_help, help_v, desc_help);             //

  try {
    // this will throw if parsing fails
    auto parsed_opts = po::parse_command_line(argc, argv, desc);

    // good, we parsed command line args, store them
    po::store(parsed_opts, args);

    // notify all args (populate toml table)
    po::notify(args);

  } catch (const po::error &ex) {
    error_str = fmt::format("bad args: {}", ex.what());
  }

  if (ttable[key::help].value_or(false)) {
    help_requested = true;

    desc.print(help_ss);
  }
}

} // namespace conf
} // namespace parley
