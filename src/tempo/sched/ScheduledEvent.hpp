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

#include <tempo/sched/TimeSequence.hpp>
#include <tempo/util/Time.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tempo
{

/* A named callback which fires at each time of its own series of UTC times.
 *
 * The event holds a cursor over its series; next_event_time() is the earliest
 * time not yet fired, or Time::end_of_time() once the series is exhausted,
 * after which the event is inert.  Only scan() and skip_until() move the
 * cursor. */
class ScheduledEvent
{
public:
  /* Callback signature; receives the event name and the scheduled time being
   * fired (not the time at which the scan happened). */
  typedef std::function<void(const std::string&, Time)> callback_fn;

  /* Default time before market close at which end-of-day events fire */
  static constexpr std::chrono::minutes security_end_of_day_delta{10};

  /* Default time before midnight at which the algorithm end-of-day event
   * fires */
  static constexpr std::chrono::minutes algorithm_end_of_day_delta{2};

  ScheduledEvent(std::string name, Time event_time, callback_fn callback);

  ScheduledEvent(std::string name, std::vector<Time> event_times,
                 callback_fn callback);

  ScheduledEvent(std::string name, std::unique_ptr<TimeSequence> event_times,
                 callback_fn callback);

  ScheduledEvent(const ScheduledEvent&) = delete;
  ScheduledEvent& operator=(const ScheduledEvent&) = delete;

  [[nodiscard]] const std::string& name() const { return _name; }

  [[nodiscard]] Time next_event_time() const { return _next_event_time; }

  [[nodiscard]] bool is_exhausted() const { return _next_event_time.is_end_of_time(); }

  [[nodiscard]] bool is_logging_enabled() const { return _logging_enabled; }

  void set_logging_enabled(bool enabled) { _logging_enabled = enabled; }

  /* Fire the callback for every pending time at or before `now`, in ascending
   * order.  The cursor moves past each time before its callback is invoked, so
   * an exception thrown by the callback (which propagates to the caller) does
   * not cause that time to fire again.  Returns the number of callbacks
   * invoked. */
  size_t scan(Time now);

  /* As scan(now), but counts each callback into `fired` before invoking it,
   * so the count survives a callback that throws. */
  void scan(Time now, size_t& fired);

  /* Advance the cursor past all times earlier than `t`, without firing. */
  void skip_until(Time t);

  /* Create an event firing at `time_of_day` on each of `dates`; the time of day
   * is added to each date as given (dates are not truncated). When `after` is
   * not empty, only times later than `after` are kept. */
  static std::shared_ptr<ScheduledEvent> every_day_at(
      std::string name, std::unique_ptr<TimeSequence> dates,
      std::chrono::microseconds time_of_day, callback_fn callback,
      Time after = {});

  /* Fully scoped event name, eg create_event_name("SPY", "EndOfDay") gives
   * "SPY.EndOfDay" */
  static std::string create_event_name(const std::string& scope,
                                       const std::string& name);

private:
  void move_next();

  std::string _name;
  callback_fn _callback;
  std::unique_ptr<TimeSequence> _event_times;
  Time _next_event_time;
  bool _logging_enabled;
};

} // namespace tempo
