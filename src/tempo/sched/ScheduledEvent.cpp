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

#include <tempo/sched/ScheduledEvent.hpp>
#include <tempo/core/Logger.hpp>
#include <tempo/util/Error.hpp>

namespace tempo
{

ScheduledEvent::ScheduledEvent(std::string name, Time event_time,
                               callback_fn callback)
  : ScheduledEvent(std::move(name), std::vector<Time>{event_time},
                   std::move(callback))
{
}


ScheduledEvent::ScheduledEvent(std::string name, std::vector<Time> event_times,
                               callback_fn callback)
  : ScheduledEvent(std::move(name), make_time_sequence(std::move(event_times)),
                   std::move(callback))
{
}


ScheduledEvent::ScheduledEvent(std::string name,
                               std::unique_ptr<TimeSequence> event_times,
                               callback_fn callback)
  : _name(std::move(name)),
    _callback(std::move(callback)),
    _event_times(std::move(event_times)),
    _next_event_time(Time::end_of_time()),
    _logging_enabled(false)
{
  if (!_event_times)
    THROW("scheduled event " << QUOTE(_name) << " created without event times");
  if (!_callback)
    THROW("scheduled event " << QUOTE(_name) << " created without callback");

  move_next();
}


void ScheduledEvent::move_next()
{
  _next_event_time = _event_times->next();

  if (_logging_enabled) {
    if (_next_event_time.is_end_of_time())
      LOG_INFO("ScheduledEvent." << _name << ": completed scheduled events");
    else
      LOG_INFO("ScheduledEvent." << _name << ": next event: "
               << _next_event_time << " UTC");
  }
}


size_t ScheduledEvent::scan(Time now)
{
  size_t fired = 0;
  scan(now, fired);
  return fired;
}


void ScheduledEvent::scan(Time now, size_t& fired)
{
  // end_of_time is never reached, so an exhausted event never fires
  while (!_next_event_time.is_end_of_time() && _next_event_time <= now) {
    Time scheduled = _next_event_time;

    if (_logging_enabled)
      LOG_INFO("ScheduledEvent." << _name << ": firing at " << now
               << " UTC, scheduled at " << scheduled << " UTC");

    move_next();
    ++fired;
    _callback(_name, scheduled);
  }
}


void ScheduledEvent::skip_until(Time t)
{
  while (!_next_event_time.is_end_of_time() && _next_event_time < t)
    _next_event_time = _event_times->next();

  if (_logging_enabled)
    LOG_INFO("ScheduledEvent." << _name << ": skipped to "
             << _next_event_time << " UTC");
}


std::shared_ptr<ScheduledEvent> ScheduledEvent::every_day_at(
    std::string name, std::unique_ptr<TimeSequence> dates,
    std::chrono::microseconds time_of_day, callback_fn callback, Time after)
{
  auto times = expand(std::move(dates), [time_of_day](Time date) {
    return std::vector<Time>{date + time_of_day};
  });

  if (!after.empty())
    times = filter(std::move(times), [after](Time t) { return t > after; });

  return std::make_shared<ScheduledEvent>(std::move(name), std::move(times),
                                          std::move(callback));
}


std::string ScheduledEvent::create_event_name(const std::string& scope,
                                              const std::string& name)
{
  return scope + "." + name;
}

} // namespace tempo
