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

#include <tempo/sched/DateRules.hpp>
#include <tempo/util/Error.hpp>

#include <algorithm>
#include <sstream>

namespace tempo
{

namespace
{

enum class Adjust { none, forward, backward };


/* Ascending series of dates, one per period, between the dates of `start`
 * and `end`. Periods begin at `period` and are stepped by `advance`, and
 * `candidate` maps a period onto its date. */
std::unique_ptr<TimeSequence> period_dates(Time start, Time end, Time period,
                                           std::function<Time(Time)> advance,
                                           std::function<Time(Time)> candidate)
{
  start = start.round_to_earliest_day();
  return make_generator([=]() mutable -> Time {
    while (period <= end) {
      Time date = candidate(period);
      period = advance(period);
      if (date < start)
        continue;
      if (date > end)
        return Time::end_of_time();
      return date;
    }
    return Time::end_of_time();
  });
}


std::unique_ptr<TimeSequence> daily_dates(Time start, Time end)
{
  Time first = start.round_to_earliest_day();
  return period_dates(first, end, first,
                      [](Time t) { return t + one_day; },
                      [](Time t) { return t; });
}


Time next_month(Time t)
{
  return (t.month() == 12) ? Time::from_date(t.year() + 1, 1, 1)
                           : Time::from_date(t.year(), t.month() + 1, 1);
}


Time first_of_month(Time t) { return Time::from_date(t.year(), t.month(), 1); }


/* Monday on or before a date */
Time week_monday(Time t)
{
  Time day = t.round_to_earliest_day();
  int back = (day.day_of_week() + 6) % 7;
  return day - one_day * back;
}


std::function<Time(Time)> adjusted(std::function<Time(Time)> candidate,
                                   const ExchangeHours* hours, Adjust adjust)
{
  if (!hours || adjust == Adjust::none)
    return candidate;

  ExchangeHours copy = *hours;
  if (adjust == Adjust::forward)
    return [candidate, copy](Time period) {
      return copy.next_open_date(candidate(period));
    };
  else
    return [candidate, copy](Time period) {
      return copy.previous_open_date(candidate(period));
    };
}


std::string rule_name(const ExchangeHours* hours, std::string name, int offset)
{
  if (offset)
    name += "+" + std::to_string(offset);
  if (hours)
    return hours->name() + ": " + name;
  return name;
}


void check_offset(const char* rule, int offset, int limit)
{
  if (offset < 0 || offset > limit)
    THROW(rule << " offset must be within [0, " << limit << "], got "
          << offset);
}


DateRule make_month_start(const ExchangeHours* hours, int offset)
{
  check_offset("MonthStart", offset, 15);
  auto candidate = adjusted([offset](Time month) { return month + one_day * offset; },
                            hours, Adjust::forward);
  return DateRule(rule_name(hours, "MonthStart", offset),
                  [candidate](Time start, Time end) {
                    return period_dates(start, end, first_of_month(start),
                                        next_month, candidate);
                  });
}


DateRule make_month_end(const ExchangeHours* hours, int offset)
{
  check_offset("MonthEnd", offset, 15);
  auto candidate = adjusted(
      [offset](Time month) {
        int last = Time::days_in_month(month.year(), month.month());
        return month + one_day * (last - 1 - offset);
      },
      hours, Adjust::backward);
  return DateRule(rule_name(hours, "MonthEnd", offset),
                  [candidate](Time start, Time end) {
                    return period_dates(start, end, first_of_month(start),
                                        next_month, candidate);
                  });
}


DateRule make_week_start(const ExchangeHours* hours, int offset)
{
  check_offset("WeekStart", offset, 4);
  auto candidate = adjusted([offset](Time monday) { return monday + one_day * offset; },
                            hours, Adjust::forward);
  return DateRule(rule_name(hours, "WeekStart", offset),
                  [candidate](Time start, Time end) {
                    return period_dates(start, end, week_monday(start),
                                        [](Time t) { return t + one_day * 7; },
                                        candidate);
                  });
}


DateRule make_week_end(const ExchangeHours* hours, int offset)
{
  check_offset("WeekEnd", offset, 4);
  auto candidate = adjusted(
      [offset](Time monday) { return monday + one_day * (4 - offset); },
      hours, Adjust::backward);
  return DateRule(rule_name(hours, "WeekEnd", offset),
                  [candidate](Time start, Time end) {
                    return period_dates(start, end, week_monday(start),
                                        [](Time t) { return t + one_day * 7; },
                                        candidate);
                  });
}

} // namespace


std::unique_ptr<TimeSequence> DateRule::dates(Time start, Time end) const
{
  if (end < start)
    return make_time_sequence({});
  return _fn(start, end);
}


DateRules::DateRules(std::function<Time()> clock,
                     std::chrono::minutes utc_offset)
  : _clock(std::move(clock)), _utc_offset(utc_offset)
{
}


std::string DateRules::weekday_name(int weekday)
{
  static const char* names[] = {"Sunday",   "Monday", "Tuesday", "Wednesday",
                                "Thursday", "Friday", "Saturday"};
  if (weekday < 0 || weekday > 6)
    THROW("invalid weekday " << weekday);
  return names[weekday];
}


DateRule DateRules::on(std::vector<Time> dates) const
{
  std::ostringstream oss;
  oss << "On ";
  for (auto& date : dates) {
    date = date.round_to_earliest_day();
    if (&date != &dates.front())
      oss << ",";
    oss << date.strftime("%Y-%m-%d");
  }

  std::sort(dates.begin(), dates.end());
  dates.erase(std::unique(dates.begin(), dates.end()), dates.end());

  return DateRule(oss.str(), [dates](Time start, Time end) {
    std::vector<Time> selected;
    Time first = start.round_to_earliest_day();
    for (auto& date : dates)
      if (date >= first && date <= end)
        selected.push_back(date);
    return make_time_sequence(std::move(selected));
  });
}


DateRule DateRules::on(int year, int month, int day) const
{
  return on(std::vector<Time>{Time::from_date(year, month, day)});
}


DateRule DateRules::every_day() const
{
  return DateRule("EveryDay", daily_dates);
}


DateRule DateRules::every_day(const ExchangeHours& hours) const
{
  ExchangeHours copy = hours;
  return DateRule(hours.name() + ": EveryDay", [copy](Time start, Time end) {
    return filter(daily_dates(start, end),
                  [copy](Time date) { return copy.is_date_open(date); });
  });
}


DateRule DateRules::every(std::set<int> weekdays) const
{
  if (weekdays.empty())
    THROW("Every date rule requires at least one weekday");

  std::ostringstream oss;
  oss << "Every ";
  for (int day : weekdays) {
    if (day != *weekdays.begin())
      oss << ",";
    oss << weekday_name(day);
  }

  return DateRule(oss.str(), [weekdays](Time start, Time end) {
    return filter(daily_dates(start, end), [weekdays](Time date) {
      return weekdays.count(date.day_of_week()) != 0;
    });
  });
}


DateRule DateRules::month_start(int offset) const
{
  return make_month_start(nullptr, offset);
}


DateRule DateRules::month_start(const ExchangeHours& hours, int offset) const
{
  return make_month_start(&hours, offset);
}


DateRule DateRules::month_end(int offset) const
{
  return make_month_end(nullptr, offset);
}


DateRule DateRules::month_end(const ExchangeHours& hours, int offset) const
{
  return make_month_end(&hours, offset);
}


DateRule DateRules::week_start(int offset) const
{
  return make_week_start(nullptr, offset);
}


DateRule DateRules::week_start(const ExchangeHours& hours, int offset) const
{
  return make_week_start(&hours, offset);
}


DateRule DateRules::week_end(int offset) const
{
  return make_week_end(nullptr, offset);
}


DateRule DateRules::week_end(const ExchangeHours& hours, int offset) const
{
  return make_week_end(&hours, offset);
}


Time DateRules::local_today() const
{
  Time now = _clock ? _clock() : Time::realtime_now();
  return (now + _utc_offset).round_to_earliest_day();
}


DateRule DateRules::today() const
{
  Time date = local_today();
  return DateRule("Today", [date](Time start, Time end) {
    std::vector<Time> dates;
    if (date >= start.round_to_earliest_day() && date <= end)
      dates.push_back(date);
    return make_time_sequence(std::move(dates));
  });
}


DateRule DateRules::tomorrow() const
{
  Time date = local_today() + one_day;
  return DateRule("Tomorrow", [date](Time start, Time end) {
    std::vector<Time> dates;
    if (date >= start.round_to_earliest_day() && date <= end)
      dates.push_back(date);
    return make_time_sequence(std::move(dates));
  });
}

} // namespace tempo
