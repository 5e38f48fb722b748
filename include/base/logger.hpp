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
#include "base/elapsed.hpp"
#include "base/types.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <chrono>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/os.h>
#include <memory>
#include <mutex>

namespace parley {

class Logger;

extern std::unique_ptr<Logger> _logger;

class Logger {

public:
  Logger(asio::io_context &app_io_ctx) noexcept;
  Logger(const Logger &) = delete;
  Logger(Logger &&) = delete;

  ~Logger() noexcept;

  static Logger *create(asio::io_context &app_io_ctx) noexcept {
    _logger = std::make_unique<Logger>(app_io_ctx);

    return _logger.get();
  }

  template <typename... Args>
  void info(csv mod_id, csv cat, fmt::format_string<Args...> format, Args &&...args) {

    if (should_log(mod_id, cat)) {
      const auto runtime{e.as<millis_fp>()};

      auto prefix = fmt::format("{:>{}.{}} {:<{}} {:<{}}", //
                                runtime,            // millis since app start
                                width_ts,           // width of timestamp field
                                width_ts_precision, // runtime + width and precision
                                mod_id, width_mod,  // module_id + width
                                cat, width_cat);    // category + width

      auto msg = fmt::format(format, std::forward<Args>(args)...);

      if (msg.empty() || (msg.back() != '\n')) msg.append("\n");

      if (async_active && !app_io_ctx.stopped()) {
        asio::post(app_io_ctx, [this, prefix = std::move(prefix), msg = std::move(msg)]() {
          print(prefix, msg);
        });

      } else {
        print(prefix, msg);
      }
    }
  }

  /// @brief Should a message for the module and category be logged
  ///
  ///        order of precedence:
  ///         1. logger.<cat>       == boolean
  ///         2. logger.<mod>       == boolean
  ///         3. logger.<mod>.<cat> == boolean
  /// @param mod module id
  /// @param cat category
  /// @return boolean
  bool should_log(csv mod, csv cat) const noexcept {

    if ((cat == csv{"info"}) || tokc.empty()) return true;

    const auto &t = tokc.table();
    const std::array paths{string(cat), string(mod), fmt::format("{}.{}", mod, cat)};

    return std::all_of(paths.begin(), paths.end(), [&t](const auto &p) {
      const auto node = t.at_path(p);

      return node.is_boolean() ? node.value_or(true) : true;
    });
  }

  static void shutdown() noexcept { _logger.reset(); }
  static void synchronous() noexcept {
    if (_logger) _logger->async_active = false;
  }

private:
  void print(const string &prefix, const string &msg) noexcept;

private:
  // order dependent
  conf::token tokc;
  asio::io_context &app_io_ctx;
  fmt::ostream out;

  // order independent
  std::atomic_bool async_active{false};
  std::mutex out_mtx;
  static Elapsed e;

public:
  // order independent
  static constexpr int width_cat{12};
  static constexpr int width_mod{18};
  static constexpr int width_ts_precision{1};
  static constexpr int width_ts{13};

public:
  MOD_ID("logger");
};

/// @brief Log a message when the Logger exists, otherwise a no-op
template <typename... Args>
inline void log_info(csv mod, csv cat, fmt::format_string<Args...> format, Args &&...args) {
  if (_logger) _logger->info(mod, cat, format, std::forward<Args>(args)...);
}

#define INFO(__cat, format, ...) parley::log_info(module_id, __cat, format, ##__VA_ARGS__)

#define INFO_AUTO_CAT(cat)                                                                         \
  static constexpr std::string_view fn_id { cat }

#define INFO_AUTO(format, ...) parley::log_info(module_id, fn_id, format, ##__VA_ARGS__)

#define INFO_INIT(format, ...) parley::log_info(module_id, "init"sv, format, ##__VA_ARGS__)

inline bool SHOULD_LOG(csv mid, csv cat) noexcept {
  return _logger ? _logger->should_log(mid, cat) : false;
}

} // namespace parley
