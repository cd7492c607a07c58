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

#include <tempo/sched/UniverseScheduler.hpp>
#include <tempo/core/Logger.hpp>
#include <tempo/util/Error.hpp>

#include <exception>

namespace tempo
{

UniverseScheduler::UniverseScheduler(EventScheduler& scheduler, Algorithm& algo,
                                     std::chrono::minutes algorithm_utc_offset)
  : _scheduler(scheduler),
    _algo(algo),
    _handles_security_end_of_day(algo.handles_security_end_of_day()),
    _utc_offset(algorithm_utc_offset),
    _exchanges(std::make_shared<ExchangeRegistry>())
{
}


void UniverseScheduler::ExchangeRegistry::track(const ExchangeHours& hours)
{
  std::lock_guard<std::mutex> guard(mutex);
  auto iter = exchanges.find(hours.name());
  if (iter == exchanges.end())
    exchanges.emplace(hours.name(), TrackedExchange{hours, 1});
  else
    iter->second.securities++;
}


void UniverseScheduler::ExchangeRegistry::untrack(const std::string& name)
{
  std::lock_guard<std::mutex> guard(mutex);
  auto iter = exchanges.find(name);
  if (iter != exchanges.end() && --iter->second.securities == 0)
    exchanges.erase(iter);
}


/* With no exchange tracked every date counts as open */
bool UniverseScheduler::ExchangeRegistry::any_open(Time date)
{
  std::lock_guard<std::mutex> guard(mutex);
  if (exchanges.empty())
    return true;
  for (auto& item : exchanges)
    if (item.second.hours.is_date_open(date))
      return true;
  return false;
}


void UniverseScheduler::on_securities_changed(const SecurityChanges& changes)
{
  for (auto& security : changes.added)
    add_security(security);

  for (auto& security : changes.removed)
    remove_security(security);
}


void UniverseScheduler::add_security(const Security& security)
{
  if (_securities.count(security.symbol))
    return;

  Time now = _scheduler.current_time();
  if (_handles_security_end_of_day && now.empty())
    THROW("cannot schedule end of day for " << QUOTE(security.symbol)
          << " before the current time is set");

  _securities.emplace(security.symbol, security);

  _exchanges->track(security.hours);

  if (!_handles_security_end_of_day)
    return;

  ExchangeHours hours = security.hours;
  Time cursor = now;
  auto times = make_generator([hours, cursor]() mutable {
    cursor = hours.next_market_close(cursor);
    return cursor - ScheduledEvent::security_end_of_day_delta;
  });

  Algorithm& algo = _algo;
  std::string symbol = security.symbol;
  auto event = std::make_shared<ScheduledEvent>(
      ScheduledEvent::create_event_name(symbol, end_of_day_name),
      std::move(times), [&algo, symbol](const std::string& name, Time) {
        try {
          algo.on_end_of_day(symbol);
        } catch (const std::exception& e) {
          THROW("Runtime error in " << name << " event: " << e.what());
        }
      });
  event->skip_until(now);

  LOG_DEBUG("adding " << QUOTE(event->name()) << ", first time "
            << event->next_event_time());
  _scheduler.add(std::move(event));
}


void UniverseScheduler::remove_security(const Security& security)
{
  auto iter = _securities.find(security.symbol);
  if (iter == _securities.end())
    return;

  _exchanges->untrack(iter->second.hours.name());

  _securities.erase(iter);

  if (_handles_security_end_of_day)
    _scheduler.remove(
        ScheduledEvent::create_event_name(security.symbol, end_of_day_name));
}


std::shared_ptr<ScheduledEvent> UniverseScheduler::add_algorithm_end_of_day(
    Time start, Time end)
{
  auto offset = _utc_offset;
  Time first = (start + offset).round_to_earliest_day();
  Time last = end.is_end_of_time() ? end : end + offset;

  // a date is a trading day if any exchange traded by the universe, at the
  // time the date is reached, trades on it
  std::shared_ptr<ExchangeRegistry> exchanges = _exchanges;
  auto dates = filter(
      make_generator([first, last]() mutable {
        if (first > last)
          return Time::end_of_time();
        Time date = first;
        first += one_day;
        return date;
      }),
      [exchanges](Time date) { return exchanges->any_open(date); });

  Algorithm& algo = _algo;
  auto event = ScheduledEvent::every_day_at(
      ScheduledEvent::create_event_name(algorithm_scope, end_of_day_name),
      std::move(dates),
      one_day - ScheduledEvent::algorithm_end_of_day_delta - offset,
      [&algo](const std::string& name, Time) {
        try {
          algo.on_end_of_day();
        } catch (const std::exception& e) {
          THROW("Runtime error in " << name << " event: " << e.what());
        }
      });
  event->skip_until(start);

  _scheduler.add(event);
  return event;
}

} // namespace tempo
