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
#include "bridge/observer.hpp"
#include "bridge/session.hpp"

#include <memory>
#include <mutex>

namespace parley {
namespace bridge {

/// @brief Single slot holder of the active session and the optional
///        observer connection.  Both slots share one lock.
class Registry {
public:
  Registry() = default;
  Registry(const Registry &) = delete;
  Registry &operator=(const Registry &) = delete;

  /// @brief Make session the active session, unconditionally replacing
  ///        any previous session.  The replaced session is not stopped.
  /// @param session new active session
  /// @return the replaced session (may be null)
  std::shared_ptr<Session> set_active(std::shared_ptr<Session> session) noexcept;

  /// @brief The active session
  /// @return session or null
  std::shared_ptr<Session> active() const noexcept;

  /// @brief Release the active slot only if it still holds session
  /// @param session session being torn down
  /// @return true when the slot was released
  bool clear_if(const std::shared_ptr<Session> &session) noexcept;

  void attach_observer(std::shared_ptr<Observer> obs) noexcept;

  /// @brief Release the observer slot only if it still holds obs
  /// @param obs observer being detached
  /// @return true when the slot was released
  bool detach_observer(const std::shared_ptr<Observer> &obs) noexcept;

  std::shared_ptr<Observer> observer() const noexcept;

private:
  mutable std::mutex mtx;
  std::shared_ptr<Session> session;
  std::shared_ptr<Observer> obs;

public:
  MOD_ID("bridge.registry");
};

} // namespace bridge
} // namespace parley
