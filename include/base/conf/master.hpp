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

#include "base/conf/keys.hpp"
#include "base/conf/toml.hpp"
#include "base/types.hpp"

#include <array>
#include <memory>

namespace parley {
namespace conf {

class master;
extern std::unique_ptr<master> mptr;

/// @brief Owner of the merged configuration: command line args, build
///        info and the parsed configuration file
class master {
public:
  // note: ordered by relevance
  enum MSG_TYPE : uint8_t { HelpMsg = 0, ArgsErrMsg, ParseMsg, InitMsg };

public:
  master(int argc, char *argv[]) noexcept;
  ~master() = default;

  static master *create(int argc, char *argv[]) noexcept {
    mptr = std::make_unique<master>(argc, argv);

    return mptr.get();
  }

  /// @brief Copy the subtable at root into dest (empty table when absent
  ///        or when master has not been created)
  /// @param root top level key (typically a module id)
  /// @param dest destination table
  static void copy_to(csv root, toml::table &dest) noexcept;

  const string &get_first_msg() const noexcept;
  const string &get_msg(MSG_TYPE t) const noexcept { return msgs[t]; }

  /// @brief Help was requested or an error prevents startup
  /// @return boolean
  bool nominal_start() const noexcept {
    return msgs[HelpMsg].empty() && msgs[ArgsErrMsg].empty() && msgs[ParseMsg].empty();
  }

  bool parse_ok() const noexcept { return msgs[ParseMsg].empty(); }

  static void reset() noexcept { mptr.reset(); }

  const auto &table_direct() const noexcept { return ttable; }

private:
  void parse() noexcept;

private:
  // order dependent
  toml::table ttable;

  // order independent
  std::array<string, 4> msgs;

public:
  MOD_ID("conf.master");
};

} // namespace conf
} // namespace parley
