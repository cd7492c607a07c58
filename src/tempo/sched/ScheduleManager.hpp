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

#include <tempo/sched/DateRules.hpp>
#include <tempo/sched/EventScheduler.hpp>
#include <tempo/sched/ScheduledEvent.hpp>
#include <tempo/sched/TimeRules.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tempo
{

class ScheduleBuilder;

/* Creates scheduled events from date and time rules and adds them to a
 * scheduler.  Local dates and times of day are interpreted using the UTC
 * offset of the manager. */
class ScheduleManager
{
public:
  /* The clock supplies the current UTC time; it defaults to the current time
   * of the scheduler. */
  explicit ScheduleManager(EventScheduler& scheduler,
                           std::chrono::minutes utc_offset = std::chrono::minutes(0),
                           std::function<Time()> clock = {});

  ScheduleManager(const ScheduleManager&) = delete;
  ScheduleManager& operator=(const ScheduleManager&) = delete;

  const DateRules& date_rules() const { return _date_rules; }
  const TimeRules& time_rules() const { return _time_rules; }

  EventScheduler& scheduler() { return _scheduler; }

  Time now() const;

  /* Schedule `callback` at the times produced by the rules, beginning one
   * day before the current time, and skipping times already past.  The
   * current time must have been set.  The default event name is
   * "<date rule>: <time rule>". */
  std::shared_ptr<ScheduledEvent> on(const DateRule& date_rule,
                                     const TimeRule& time_rule,
                                     ScheduledEvent::callback_fn callback,
                                     std::string name = "");

  /* Begin a fluent definition of an event */
  ScheduleBuilder event(std::string name = "");

  void add(std::shared_ptr<ScheduledEvent> event);
  void remove(const std::shared_ptr<ScheduledEvent>& event);
  void remove(const std::string& name);

private:
  EventScheduler& _scheduler;
  std::function<Time()> _clock;
  DateRules _date_rules;
  TimeRules _time_rules;
};


/* Fluent event definition: a date rule, one or more time
 * rules, optional filters, and finally run().  For example,
 *
 *   manager.event("rebalance").month_start().at(9, 45).run(fn);
 */
class ScheduleBuilder
{
public:
  typedef std::function<bool(Time)> predicate_fn;

  ScheduleBuilder(ScheduleManager& manager, std::string name);

  // dates, only one may be given
  ScheduleBuilder& every_day();
  ScheduleBuilder& every_day(const ExchangeHours&);
  ScheduleBuilder& every(std::set<int> weekdays);
  ScheduleBuilder& on(int year, int month, int day);
  ScheduleBuilder& on(std::vector<Time> dates);
  ScheduleBuilder& month_start(int offset = 0);
  ScheduleBuilder& month_end(int offset = 0);
  ScheduleBuilder& week_start(int offset = 0);
  ScheduleBuilder& week_end(int offset = 0);
  ScheduleBuilder& date_rule(DateRule);

  // times of day, repeated calls are combined
  ScheduleBuilder& at(int hour, int minute = 0, int second = 0);
  ScheduleBuilder& every(std::chrono::microseconds interval);
  ScheduleBuilder& after_market_open(const ExchangeHours&,
                                     std::chrono::minutes minutes_after = std::chrono::minutes(0));
  ScheduleBuilder& before_market_close(const ExchangeHours&,
                                       std::chrono::minutes minutes_before = std::chrono::minutes(0));
  ScheduleBuilder& time_rule(TimeRule);

  /* Keep only the UTC event times satisfying the predicate */
  ScheduleBuilder& where(predicate_fn);

  /* Create the event and add it to the scheduler */
  std::shared_ptr<ScheduledEvent> run(ScheduledEvent::callback_fn callback);

private:
  ScheduleManager& _manager;
  std::string _name;
  std::optional<DateRule> _date_rule;
  std::vector<TimeRule> _time_rules;
  std::vector<predicate_fn> _predicates;
};

} // namespace tempo
