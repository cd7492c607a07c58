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

#include <tempo/sched/ExchangeHours.hpp>
#include <tempo/sched/TimeSequence.hpp>
#include <tempo/util/Time.hpp>

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace tempo
{

/* Named rule producing an ascending series of local dates (each at midnight)
 * within a date range. */
class DateRule
{
public:
  typedef std::function<std::unique_ptr<TimeSequence>(Time, Time)> dates_fn;

  DateRule(std::string name, dates_fn fn)
    : _name(std::move(name)), _fn(std::move(fn))
  {
  }

  [[nodiscard]] const std::string& name() const { return _name; }

  /* Dates from the date of `start` up to and including `end`, which can be
   * Time::end_of_time() for an unbounded series */
  [[nodiscard]] std::unique_ptr<TimeSequence> dates(Time start, Time end) const;

private:
  std::string _name;
  dates_fn _fn;
};


/* Factory of common date rules.  Weekdays are numbered from Sunday = 0.  Rules
 * taking an ExchangeHours move each date onto a trading date of that
 * exchange. */
class DateRules
{
public:
  /* The clock provides the UTC time used by today() and tomorrow(), which are
   * converted to local dates using `utc_offset`. */
  explicit DateRules(std::function<Time()> clock = {},
                     std::chrono::minutes utc_offset = std::chrono::minutes(0));

  DateRule on(std::vector<Time> dates) const;
  DateRule on(int year, int month, int day) const;

  DateRule every_day() const;
  DateRule every_day(const ExchangeHours&) const;

  DateRule every(std::set<int> weekdays) const;

  /* Day 1 + offset of each month; offset must be within [0, 15] */
  DateRule month_start(int offset = 0) const;
  DateRule month_start(const ExchangeHours&, int offset = 0) const;

  /* Last day - offset of each month; offset must be within [0, 15] */
  DateRule month_end(int offset = 0) const;
  DateRule month_end(const ExchangeHours&, int offset = 0) const;

  /* Monday + offset of each week; offset must be within [0, 4] */
  DateRule week_start(int offset = 0) const;
  DateRule week_start(const ExchangeHours&, int offset = 0) const;

  /* Friday - offset of each week; offset must be within [0, 4] */
  DateRule week_end(int offset = 0) const;
  DateRule week_end(const ExchangeHours&, int offset = 0) const;

  DateRule today() const;
  DateRule tomorrow() const;

  static std::string weekday_name(int weekday);

private:
  Time local_today() const;

  std::function<Time()> _clock;
  std::chrono::minutes _utc_offset;
};

} // namespace tempo
