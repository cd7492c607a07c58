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

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tempo
{

/* Named rule mapping a local date onto the ascending UTC times at which an
 * event fires on that date. */
class TimeRule
{
public:
  typedef std::function<std::vector<Time>(Time)> times_fn;

  TimeRule(std::string name, times_fn fn)
    : _name(std::move(name)), _fn(std::move(fn))
  {
  }

  [[nodiscard]] const std::string& name() const { return _name; }

  [[nodiscard]] std::vector<Time> times(Time local_date) const
  {
    return _fn(local_date);
  }

  [[nodiscard]] const times_fn& times_function() const { return _fn; }

  /* Expand a series of local dates into the series of UTC times */
  [[nodiscard]] std::unique_ptr<TimeSequence> create_utc_times(
      std::unique_ptr<TimeSequence> dates) const;

private:
  std::string _name;
  times_fn _fn;
};


/* Factory of common time rules.  Times of day given without an explicit
 * offset are interpreted using the default UTC offset of the factory. */
class TimeRules
{
public:
  explicit TimeRules(std::chrono::minutes utc_offset = std::chrono::minutes(0))
    : _utc_offset(utc_offset)
  {
  }

  void set_default_utc_offset(std::chrono::minutes offset) { _utc_offset = offset; }

  [[nodiscard]] std::chrono::minutes default_utc_offset() const { return _utc_offset; }

  TimeRule at(int hour, int minute = 0, int second = 0) const;
  TimeRule at(std::chrono::microseconds time_of_day,
              std::chrono::minutes utc_offset) const;

  /* Every multiple of `interval` within each day */
  TimeRule every(std::chrono::microseconds interval) const;

  /* Times relative to the market hours of an exchange, on its trading days
   * only */
  TimeRule after_market_open(const ExchangeHours&,
                             std::chrono::minutes minutes_after = std::chrono::minutes(0)) const;
  TimeRule before_market_close(const ExchangeHours&,
                               std::chrono::minutes minutes_before = std::chrono::minutes(0)) const;

  TimeRule midnight() const;
  TimeRule noon() const;

  /* Merge several rules; duplicate times on a date fire once */
  static TimeRule combine(std::vector<TimeRule> rules);

private:
  std::chrono::minutes _utc_offset;
};

} // namespace tempo
