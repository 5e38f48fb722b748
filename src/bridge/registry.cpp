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

#include "bridge/registry.hpp"
#include "base/logger.hpp"

#include <utility>

namespace parley {
namespace bridge {

std::shared_ptr<Session> Registry::set_active(std::shared_ptr<Session> next) noexcept {
  std::unique_lock lck(mtx);

  auto prev = std::exchange(session, next);
  lck.unlock();

  if (prev) INFO("replace", "{} replaced", prev->id());

  return prev;
}

std::shared_ptr<Session> Registry::active() const noexcept {
  std::scoped_lock lck(mtx);

  return session;
}

bool Registry::clear_if(const std::shared_ptr<Session> &s) noexcept {
  std::scoped_lock lck(mtx);

  if (session && (session == s)) {
    session.reset();
    return true;
  }

  return false;
}

void Registry::attach_observer(std::shared_ptr<Observer> o) noexcept {
  std::scoped_lock lck(mtx);

  obs = std::move(o);
}

bool Registry::detach_observer(const std::shared_ptr<Observer> &o) noexcept {
  std::scoped_lock lck(mtx);

  if (obs && (obs == o)) {
    obs.reset();
    return true;
  }

  return false;
}

std::shared_ptr<Observer> Registry::observer() const noexcept {
  std::scoped_lock lck(mtx);

  return obs;
}

} // namespace bridge
} // namespace parley
