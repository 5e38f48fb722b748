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

#include "base/stats.hpp"
#include "base/logger.hpp"
#include "base/stats/map.hpp"

#include <fmt/format.h>
#include <iterator>

namespace parley {

std::unique_ptr<Stats> _stats;

Stats::Stats(asio::io_context &app_io_ctx) noexcept
    : tokc(module_id),           // our config
      app_io_ctx(app_io_ctx),    // writes are posted here
      val_txt(stats::make_map()) //
{
  const auto enabled = tokc.val<bool>("enabled", false);
  db_uri = tokc.val("db_uri", "http://localhost:8086?db=parley");

  auto w = std::back_inserter(init_msg);

  fmt::format_to(w, "{} db_uri={} val_map={}", enabled ? "enabled" : "disabled",
                 db_uri.empty() ? "<unset>" : "<set>", val_txt.size());

  if (enabled && !db_uri.empty()) {
    const auto batch_of = tokc.val<int>("batch_of", 150);

    fmt::format_to(w, " batch_of={}", batch_of);

    try {
      db = influxdb::InfluxDBFactory::Get(db_uri);
      db->batchOf(batch_of);

    } catch (const std::exception &e) {
      db.reset();
      err_msg.assign(e.what());
    }

    if (!err_msg.empty()) fmt::format_to(w, " err={}", err_msg);
  }

  INFO_INIT("{}", init_msg);
}

} // namespace parley
