/* Copyright 2024 Automated Algo (www.automatedalgo.com)

This file is part of Automated Algo's "Tempo" project.

Tempo is free software: you can redistribute it and/or modify it under the terms
of the GNU Lesser General Public License as published by the Free Software
Foundation, either version 3 of the License, or (at your option) any later
version.

Tempo is distributed in the hope that it will be useful, but WITHOUT ANY
WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
PARTICULAR PURPOSE. See the GNU Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License along
with Tempo. If not, see <https://www.gnu.org/licenses/>.
*/

#include <tempo/util/StopFlag.hpp>

namespace tempo
{

void StopFlag::request_stop()
{
  {
    std::lock_guard<std::mutex> guard(_mutex);
    if (_requested)
      return;
    _requested = true;
  }
  _requested_cv.notify_all();
}


bool StopFlag::is_requested() const
{
  std::lock_guard<std::mutex> guard(_mutex);
  return _requested;
}


bool StopFlag::wait_for_requested(std::chrono::microseconds timeout)
{
  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lock(_mutex);
  return _requested_cv.wait_until(lock, deadline, [this] { return _requested; });
}

} // namespace tempo
