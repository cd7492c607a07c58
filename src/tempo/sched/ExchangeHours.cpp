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

#include <tempo/sched/ExchangeHours.hpp>
#include <tempo/core/Logger.hpp>
#include <tempo/util/Config.hpp>
#include <tempo/util/Error.hpp>
#include <tempo/util/utils.hpp>

namespace tempo
{

ExchangeHours::ExchangeHours(std::string name,
                             std::chrono::minutes utc_offset,
                             std::chrono::minutes open,
                             std::chrono::minutes close,
                             std::set<int> weekdays)
  : _name(std::move(name)),
    _utc_offset(utc_offset),
    _open(open),
    _close(close),
    _weekdays(std::move(weekdays))
{
  if (_open.count() < 0 || _close <= _open || _close > one_day)
    THROW("invalid trading hours for exchange " << QUOTE(_name));

  if (_weekdays.empty())
    THROW("exchange " << QUOTE(_name) << " has no trading weekdays");

  for (int day : _weekdays)
    if (day < 0 || day > 6)
      THROW("invalid weekday " << day << " for exchange " << QUOTE(_name));

  if (_utc_offset > one_day || _utc_offset < -one_day)
    THROW("invalid utc offset for exchange " << QUOTE(_name));
}


ExchangeHours ExchangeHours::us_equity()
{
  return ExchangeHours("us_equity", std::chrono::hours(-5),
                       std::chrono::hours(9) + std::chrono::minutes(30),
                       std::chrono::hours(16));
}


ExchangeHours ExchangeHours::always_open()
{
  return ExchangeHours("always_open", std::chrono::minutes(0),
                       std::chrono::minutes(0), one_day,
                       {0, 1, 2, 3, 4, 5, 6});
}


std::chrono::minutes parse_time_of_day(const std::string& s)
{
  auto parts = split(trim(s), ':');
  if (parts.size() != 2 || parts[0].empty() || parts[1].empty())
    throw ConfigError("invalid time of day '" + s + "', expected HH:MM");

  int hours = 0;
  int minutes = 0;
  try {
    size_t pos = 0;
    hours = std::stoi(parts[0], &pos);
    if (pos != parts[0].size())
      throw std::invalid_argument(parts[0]);
    minutes = std::stoi(parts[1], &pos);
    if (pos != parts[1].size())
      throw std::invalid_argument(parts[1]);
  } catch (const std::logic_error&) {
    throw ConfigError("invalid time of day '" + s + "', expected HH:MM");
  }

  if (hours < 0 || hours > 24 || minutes < 0 || minutes > 59 ||
      (hours == 24 && minutes != 0))
    throw ConfigError("time of day out of range '" + s + "'");

  return std::chrono::hours(hours) + std::chrono::minutes(minutes);
}


ExchangeHours ExchangeHours::from_config(Config config)
{
  std::string name = config.get_string("name");

  std::set<int> weekdays = {1, 2, 3, 4, 5};
  if (config.has_field("weekdays")) {
    weekdays.clear();
    auto days = config.get_sub_config("weekdays");
    for (size_t i = 0; i < days.array_size(); ++i)
      weekdays.insert(static_cast<int>(days.get_int(i)));
  }

  ExchangeHours hours(name,
                      std::chrono::minutes(config.get_int("utc_offset_minutes", 0)),
                      parse_time_of_day(config.get_string("open")),
                      parse_time_of_day(config.get_string("close")),
                      std::move(weekdays));

  if (config.has_field("holidays")) {
    auto holidays = config.get_sub_config("holidays");
    for (size_t i = 0; i < holidays.array_size(); ++i)
      hours.add_holiday(Time(holidays.get_string(i)));
  }

  if (config.has_field("early_closes")) {
    auto early = config.get_sub_config("early_closes");
    for (auto& date : early.field_names())
      hours.add_early_close(Time(date),
                            parse_time_of_day(early.get_string(date)));
  }

  return hours;
}


void ExchangeHours::add_holiday(Time local_date)
{
  _holidays.insert(local_date.round_to_earliest_day());
}


void ExchangeHours::add_early_close(Time local_date,
                                    std::chrono::minutes close)
{
  if (close <= _open || close > _close)
    THROW("early close for exchange " << QUOTE(_name)
          << " must be within trading hours");
  _early_closes[local_date.round_to_earliest_day()] = close;
}


Time ExchangeHours::local_date(Time utc) const
{
  return to_local(utc).round_to_earliest_day();
}


bool ExchangeHours::is_date_open(Time local_date) const
{
  Time date = local_date.round_to_earliest_day();
  return _weekdays.count(date.day_of_week()) && !_holidays.count(date);
}


Time ExchangeHours::market_open(Time local_date) const
{
  Time date = local_date.round_to_earliest_day();
  if (!is_date_open(date))
    THROW("exchange " << QUOTE(_name) << " is closed on "
          << date.strftime("%Y-%m-%d"));
  return to_utc(date + _open);
}


Time ExchangeHours::market_close(Time local_date) const
{
  Time date = local_date.round_to_earliest_day();
  if (!is_date_open(date))
    THROW("exchange " << QUOTE(_name) << " is closed on "
          << date.strftime("%Y-%m-%d"));

  auto iter = _early_closes.find(date);
  auto close = (iter == _early_closes.end()) ? _close : iter->second;
  return to_utc(date + close);
}


Time ExchangeHours::next_market_close(Time utc) const
{
  // the close of the previous local date can still lie ahead, if trading
  // hours extend past midnight UTC
  Time date = local_date(utc) - one_day;
  Time limit = date + std::chrono::hours(24 * 366 * 2);

  for (; date < limit; date += one_day) {
    if (is_date_open(date)) {
      Time close = market_close(date);
      if (close > utc)
        return close;
    }
  }

  THROW("exchange " << QUOTE(_name) << " has no market close within two years of "
        << utc);
}


Time ExchangeHours::next_open_date(Time local_date) const
{
  Time date = local_date.round_to_earliest_day();
  for (int i = 0; i < 366 * 2; ++i, date += one_day)
    if (is_date_open(date))
      return date;
  THROW("exchange " << QUOTE(_name) << " has no trading date after "
        << local_date);
}


Time ExchangeHours::previous_open_date(Time local_date) const
{
  Time date = local_date.round_to_earliest_day();
  for (int i = 0; i < 366 * 2; ++i, date -= one_day)
    if (is_date_open(date))
      return date;
  THROW("exchange " << QUOTE(_name) << " has no trading date before "
        << local_date);
}

} // namespace tempo
