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

#include <tempo/sched/ScheduleManager.hpp>
#include <tempo/core/Logger.hpp>
#include <tempo/util/Error.hpp>

namespace tempo
{

ScheduleManager::ScheduleManager(EventScheduler& scheduler,
                                 std::chrono::minutes utc_offset,
                                 std::function<Time()> clock)
  : _scheduler(scheduler),
    _clock(std::move(clock)),
    _date_rules([this]() { return now(); }, utc_offset),
    _time_rules(utc_offset)
{
}


Time ScheduleManager::now() const
{
  return _clock ? _clock() : _scheduler.current_time();
}


std::shared_ptr<ScheduledEvent> ScheduleManager::on(
    const DateRule& date_rule, const TimeRule& time_rule,
    ScheduledEvent::callback_fn callback, std::string name)
{
  if (name.empty())
    name = date_rule.name() + ": " + time_rule.name();

  Time current = now();
  if (current.empty())
    THROW("cannot schedule event " << QUOTE(name)
          << " before the current time is set");

  // begin a day early, so that a time rule moving into the previous UTC day
  // still produces today's times
  Time start = (current + _time_rules.default_utc_offset() - one_day)
                   .round_to_earliest_day();
  auto times = time_rule.create_utc_times(
      date_rule.dates(start, Time::end_of_time()));

  auto event = std::make_shared<ScheduledEvent>(std::move(name),
                                                std::move(times),
                                                std::move(callback));
  event->skip_until(current);

  LOG_DEBUG("scheduling event " << QUOTE(event->name()) << ", first time "
            << event->next_event_time());

  _scheduler.add(event);
  return event;
}


ScheduleBuilder ScheduleManager::event(std::string name)
{
  return ScheduleBuilder(*this, std::move(name));
}


void ScheduleManager::add(std::shared_ptr<ScheduledEvent> event)
{
  _scheduler.add(std::move(event));
}


void ScheduleManager::remove(const std::shared_ptr<ScheduledEvent>& event)
{
  _scheduler.remove(event);
}


void ScheduleManager::remove(const std::string& name)
{
  _scheduler.remove(name);
}


ScheduleBuilder::ScheduleBuilder(ScheduleManager& manager, std::string name)
  : _manager(manager), _name(std::move(name))
{
}


ScheduleBuilder& ScheduleBuilder::date_rule(DateRule rule)
{
  if (_date_rule)
    THROW("event " << QUOTE(_name) << " already has date rule "
          << QUOTE(_date_rule->name()));
  _date_rule = std::move(rule);
  return *this;
}


ScheduleBuilder& ScheduleBuilder::every_day()
{
  return date_rule(_manager.date_rules().every_day());
}


ScheduleBuilder& ScheduleBuilder::every_day(const ExchangeHours& hours)
{
  return date_rule(_manager.date_rules().every_day(hours));
}


ScheduleBuilder& ScheduleBuilder::every(std::set<int> weekdays)
{
  return date_rule(_manager.date_rules().every(std::move(weekdays)));
}


ScheduleBuilder& ScheduleBuilder::on(int year, int month, int day)
{
  return date_rule(_manager.date_rules().on(year, month, day));
}


ScheduleBuilder& ScheduleBuilder::on(std::vector<Time> dates)
{
  return date_rule(_manager.date_rules().on(std::move(dates)));
}


ScheduleBuilder& ScheduleBuilder::month_start(int offset)
{
  return date_rule(_manager.date_rules().month_start(offset));
}


ScheduleBuilder& ScheduleBuilder::month_end(int offset)
{
  return date_rule(_manager.date_rules().month_end(offset));
}


ScheduleBuilder& ScheduleBuilder::week_start(int offset)
{
  return date_rule(_manager.date_rules().week_start(offset));
}


ScheduleBuilder& ScheduleBuilder::week_end(int offset)
{
  return date_rule(_manager.date_rules().week_end(offset));
}


ScheduleBuilder& ScheduleBuilder::time_rule(TimeRule rule)
{
  _time_rules.push_back(std::move(rule));
  return *this;
}


ScheduleBuilder& ScheduleBuilder::at(int hour, int minute, int second)
{
  return time_rule(_manager.time_rules().at(hour, minute, second));
}


ScheduleBuilder& ScheduleBuilder::every(std::chrono::microseconds interval)
{
  return time_rule(_manager.time_rules().every(interval));
}


ScheduleBuilder& ScheduleBuilder::after_market_open(
    const ExchangeHours& hours, std::chrono::minutes minutes_after)
{
  return time_rule(_manager.time_rules().after_market_open(hours, minutes_after));
}


ScheduleBuilder& ScheduleBuilder::before_market_close(
    const ExchangeHours& hours, std::chrono::minutes minutes_before)
{
  return time_rule(
      _manager.time_rules().before_market_close(hours, minutes_before));
}


ScheduleBuilder& ScheduleBuilder::where(predicate_fn predicate)
{
  if (!predicate)
    THROW("event " << QUOTE(_name) << " given empty predicate");
  _predicates.push_back(std::move(predicate));
  return *this;
}


std::shared_ptr<ScheduledEvent> ScheduleBuilder::run(
    ScheduledEvent::callback_fn callback)
{
  if (!_date_rule)
    THROW("event " << QUOTE(_name) << " has no date rule");
  if (_time_rules.empty())
    THROW("event " << QUOTE(_name) << " has no time rule");

  TimeRule rule = TimeRules::combine(_time_rules);

  if (!_predicates.empty()) {
    auto predicates = _predicates;
    auto base = rule.times_function();
    rule = TimeRule(rule.name(), [base, predicates](Time date) {
      std::vector<Time> times;
      for (auto t : base(date)) {
        bool keep = true;
        for (auto& pred : predicates)
          keep = keep && pred(t);
        if (keep)
          times.push_back(t);
      }
      return times;
    });
  }

  return _manager.on(*_date_rule, rule, std::move(callback), _name);
}

} // namespace tempo
