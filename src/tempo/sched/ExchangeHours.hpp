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

#include <tempo/util/Time.hpp>

#include <chrono>
#include <map>
#include <set>
#include <string>

namespace tempo
{

class Config;

/* Trading calendar of a single exchange.
 *
 * Local dates are represented as a Time at midnight of that date, with no
 * timezone attached; local = utc + utc_offset.  The offset is fixed, daylight
 * saving transitions are not modelled. */
class ExchangeHours
{
public:
  ExchangeHours(std::string name,
                std::chrono::minutes utc_offset,
                std::chrono::minutes open,
                std::chrono::minutes close,
                std::set<int> weekdays = {1, 2, 3, 4, 5});

  /* US equity market: UTC-5, 09:30 to 16:00, Monday to Friday */
  static ExchangeHours us_equity();

  /* Market open all day, every day, in UTC */
  static ExchangeHours always_open();

  static ExchangeHours from_config(Config);

  [[nodiscard]] const std::string& name() const { return _name; }
  [[nodiscard]] std::chrono::minutes utc_offset() const { return _utc_offset; }
  [[nodiscard]] std::chrono::minutes open_time() const { return _open; }
  [[nodiscard]] std::chrono::minutes close_time() const { return _close; }

  void add_holiday(Time local_date);

  /* Mark a date on which the market closes early, at `close` local time */
  void add_early_close(Time local_date, std::chrono::minutes close);

  [[nodiscard]] Time to_local(Time utc) const { return utc + _utc_offset; }
  [[nodiscard]] Time to_utc(Time local) const { return local - _utc_offset; }

  /* Local date, at midnight, of a UTC time */
  [[nodiscard]] Time local_date(Time utc) const;

  /* Whether the market trades on a local date */
  [[nodiscard]] bool is_date_open(Time local_date) const;

  /* UTC time of the market open on a local date; throws if the market does
   * not trade on that date */
  [[nodiscard]] Time market_open(Time local_date) const;

  /* UTC time of the market close on a local date, taking early closes into
   * account; throws if the market does not trade on that date */
  [[nodiscard]] Time market_close(Time local_date) const;

  /* First market close strictly after a UTC time */
  [[nodiscard]] Time next_market_close(Time utc) const;

  /* Nearest trading date on or after (or, when searching backwards, on or
   * before) a local date */
  [[nodiscard]] Time next_open_date(Time local_date) const;
  [[nodiscard]] Time previous_open_date(Time local_date) const;

private:
  std::string _name;
  std::chrono::minutes _utc_offset;
  std::chrono::minutes _open;
  std::chrono::minutes _close;
  std::set<int> _weekdays;
  std::set<Time> _holidays;
  std::map<Time, std::chrono::minutes> _early_closes;
};


/* Parse a local time of day in "HH:MM" format */
std::chrono::minutes parse_time_of_day(const std::string&);

} // namespace tempo
