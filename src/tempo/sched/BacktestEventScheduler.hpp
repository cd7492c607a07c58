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

#include <tempo/sched/EventQueue.hpp>
#include <tempo/sched/EventScheduler.hpp>

namespace tempo
{

/* Single threaded scheduler driven by simulated time.  Callback exceptions
 * propagate to the caller of set_time, and time is not permitted to move
 * backwards. */
class BacktestEventScheduler : public EventScheduler
{
public:
  explicit BacktestEventScheduler(SchedulerOptions options = {});

  BacktestEventScheduler(const BacktestEventScheduler&) = delete;
  BacktestEventScheduler& operator=(const BacktestEventScheduler&) = delete;

  void add(std::shared_ptr<ScheduledEvent>) override;
  void remove(const std::shared_ptr<ScheduledEvent>&) override;
  void remove(const std::string& name) override;

  void set_time(Time now) override;
  void scan_past_events(Time now) override { set_time(now); }

  Time current_time() const override { return _current; }
  size_t size() const override { return _queue.size(); }
  bool contains(const std::shared_ptr<ScheduledEvent>&) const override;
  Time next_event_time() override { return _queue.next_event_time(); }

private:
  SchedulerOptions _options;
  EventQueue _queue;
  Time _current;
};

} // namespace tempo
