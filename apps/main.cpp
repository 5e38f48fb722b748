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

#include "app.hpp"
#include "base/conf/master.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char *argv[]) {
  using namespace parley;

  int rc{EXIT_FAILURE}; // exit code, default to failed

  // handle cli args, config parse
  auto *master = conf::master::create(argc, argv);

  if (master->nominal_start()) {
    App app;

    rc = app.main();

  } else {
    // the app isn't runnable for one of the following reasons:
    //  -cli help requested
    //  -cli args bad
    //  -configuration file failed to parse
    if (!master->get_msg(conf::master::HelpMsg).empty()) rc = EXIT_SUCCESS;

    std::cout << master->get_first_msg() << std::endl;
  }

  conf::master::reset();

  return rc;
}
