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

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tempo
{

/* One-shot stop request raised by a controlling thread and polled, or waited
 * on, by a worker thread. Once raised it stays raised. */
class StopFlag
{
public:
  StopFlag() = default;
  StopFlag(const StopFlag&) = delete;
  StopFlag& operator=(const StopFlag&) = delete;

  void request_stop();

  bool is_requested() const;

  /* Sleep for up to `timeout`, waking early if a stop is requested. Returns
   * true when a stop has been requested. */
  bool wait_for_requested(std::chrono::microseconds timeout);

private:
  mutable std::mutex _mutex;
  std::condition_variable _requested_cv;
  bool _requested = false;
};

} // namespace tempo
