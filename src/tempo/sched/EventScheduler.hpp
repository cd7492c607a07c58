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

#include <tempo/sched/ScheduledEvent.hpp>
#include <tempo/util/Time.hpp>
#include <tempo/util/utils.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace tempo
{

class Config;

struct SchedulerOptions
{
  /* Sampling interval of the live scheduler thread */
  std::chrono::milliseconds interval{1000};

  /* Live only: on add, skip event times earlier than the last sampled time */
  bool skip_past_events = true;

  /* Enable per-event logging for every event added */
  bool log_events = false;

  /* Live only: clock sampled by the scheduler thread; defaults to the wall
   * clock */
  std::function<Time()> clock;

  static SchedulerOptions from_config(Config);
};


/* Base class for scheduler implementations.  A scheduler holds scheduled
 * events and, each time it is given a new current time, fires those that are
 * due, in order of time and then order of addition. */
class EventScheduler
{
public:
  virtual ~EventScheduler() = default;

  /* Add an event; adding an event object already present has no effect */
  virtual void add(std::shared_ptr<ScheduledEvent>) = 0;

  /* Remove an event; removing an absent event has no effect */
  virtual void remove(const std::shared_ptr<ScheduledEvent>&) = 0;

  /* Remove every event with the given name */
  virtual void remove(const std::string& name) = 0;

  virtual void set_time(Time now) = 0;

  /* Synchronously fire events due up to `now`; used to replay the backlog at
   * the start of a run */
  virtual void scan_past_events(Time now) = 0;

  [[nodiscard]] virtual Time current_time() const = 0;

  [[nodiscard]] virtual size_t size() const = 0;

  [[nodiscard]] virtual bool contains(
      const std::shared_ptr<ScheduledEvent>&) const = 0;

  /* Earliest pending time over all events, or end_of_time */
  virtual Time next_event_time() = 0;

  virtual void sync_stop() {}
};


/* Create the scheduler matching the run mode: backtest mode gives a
 * BacktestEventScheduler, live and paper modes give a started
 * LiveEventScheduler. */
std::unique_ptr<EventScheduler> create_event_scheduler(
    RunMode, SchedulerOptions options = {});

std::unique_ptr<EventScheduler> create_event_scheduler(RunMode, Config);

} // namespace tempo
