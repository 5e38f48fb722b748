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

#include "base/asio.hpp"
#include "base/conf/token.hpp"
#include "base/dura_t.hpp"
#include "base/stats/vals.hpp"
#include "base/types.hpp"

#include <InfluxDBFactory.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <map>
#include <memory>

namespace parley {

template <typename T>
concept IsStatsVal = IsDuration<T> || std::same_as<T, bool> || std::integral<T> ||
                     std::floating_point<T>;

class Stats;

extern std::unique_ptr<Stats> _stats;

/// @brief Write metrics to the timeseries database
///        serialized and thread safe. This class is
///        intended to be a singleton.
class Stats {

private:
  static constexpr auto DOUBLE{"double"sv};
  static constexpr auto INTEGRAL{"integral"sv};
  static constexpr auto MEASURE{"STATS"sv};
  static constexpr auto METRIC{"metric"sv};
  static constexpr auto NANOS{"nanos"sv};

public:
  /// @brief Construct the Stats object.
  ///        Do not call this directly, use create
  /// @param app_io_ctx io_context for serialization
  Stats(asio::io_context &app_io_ctx) noexcept;
  ~Stats() = default;

  /// @brief Static member function to create the Stats singleton
  /// @param app_io_ctx io_context for serialization
  /// @return raw pointer to Stats singleton
  static auto create(asio::io_context &app_io_ctx) noexcept {
    _stats = std::make_unique<Stats>(app_io_ctx);

    return _stats.get();
  }

  /// @brief Static member function to initiate shutdown
  static void shutdown() noexcept {
    if ((bool)_stats && (bool)_stats->db) {
      try {
        _stats->db->flushBatch();
      } catch (const std::exception &e) {
        _stats->err_msg.assign(e.what());
      }
    }

    _stats.reset();
  }

  /// @brief Write a metric to the timeseries db. All writes are serialized
  ///        and thread safe. A no-op when stats are not enabled or before
  ///        create() (e.g. unit tests).
  /// @tparam V type of the value to write.
  ///          Supported types:
  ///           1) std::chrono::duration (converted to integral nanos),
  ///           2) bool (converted to integral 0 or 1),
  ///           3) signed and unsigned integrals (converted to signed)
  ///           4) floating point (converted to double)
  /// @param vt enumerated metric (see stats/vals.hpp)
  /// @param v metric val (from supported list of types)
  template <typename V>
    requires IsStatsVal<V>
  static void write(stats::stats_v vt, V v) noexcept {

    if ((bool)_stats && (bool)_stats->db) {
      auto pt = influxdb::Point(string(MEASURE)).addTag(METRIC, _stats->val_txt[vt]);

      // each metric key is only associated to one field type to
      // honor influx data rules
      if constexpr (IsDuration<V>) {
        pt.addField(NANOS, static_cast<long long>(std::chrono::duration_cast<Nanos>(v).count()));
      } else if constexpr (std::same_as<V, bool>) {
        pt.addField(INTEGRAL, static_cast<long long>(v));
      } else if constexpr (std::integral<V>) {
        pt.addField(INTEGRAL, static_cast<long long>(v));
      } else {
        pt.addField(DOUBLE, static_cast<double>(v));
      }

      // now post the pt for serialized write to influx
      asio::post(_stats->app_io_ctx, [pt = std::move(pt)]() mutable {
        if ((bool)_stats && (bool)_stats->db) {
          try {
            _stats->db->write(std::move(pt));
          } catch (const std::exception &e) {
            _stats->err_msg.assign(e.what());
          }
        }
      });
    }
  }

private:
  // order dependent
  conf::token tokc;
  asio::io_context &app_io_ctx;

  // order independent
  string db_uri;
  std::unique_ptr<influxdb::InfluxDB> db;
  std::map<stats::stats_v, string> val_txt;

public:
  string init_msg;
  string err_msg;

public:
  MOD_ID("stats");
};

} // namespace parley
