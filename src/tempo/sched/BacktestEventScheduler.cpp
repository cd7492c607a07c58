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

#include <tempo/sched/BacktestEventScheduler.hpp>
#include <tempo/core/Logger.hpp>
#include <tempo/util/Error.hpp>

namespace tempo
{

BacktestEventScheduler::BacktestEventScheduler(SchedulerOptions options)
  : _options(std::move(options))
{
}


void BacktestEventScheduler::add(std::shared_ptr<ScheduledEvent> event)
{
  if (!event)
    THROW("cannot add null scheduled event");

  if (_options.log_events)
    event->set_logging_enabled(true);

  if (!_queue.add(event))
    LOG_WARN("scheduled event " << QUOTE(event->name())
             << " already added, ignoring");
}


void BacktestEventScheduler::remove(const std::shared_ptr<ScheduledEvent>& event)
{
  _queue.remove(event.get());
}


void BacktestEventScheduler::remove(const std::string& name)
{
  _queue.remove(name);
}


bool BacktestEventScheduler::contains(
    const std::shared_ptr<ScheduledEvent>& event) const
{
  return _queue.contains(event.get());
}


void BacktestEventScheduler::set_time(Time now)
{
  if (!_current.empty() && now < _current) {
    LOG_WARN("attempt to set scheduler time backwards, from now: "
             << _current << ", to: " << now);
    THROW("backtest time cannot go backwards");
  }

  // checked before the clock moves, so a rejected call leaves it untouched
  if (_queue.is_scanning())
    THROW("scheduler time cannot be set from within an event callback");

  _current = now;
  _queue.fire_until(now);
}

} // namespace tempo
