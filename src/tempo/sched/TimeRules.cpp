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

#include <tempo/sched/TimeRules.hpp>
#include <tempo/util/Error.hpp>

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace tempo
{

std::unique_ptr<TimeSequence> TimeRule::create_utc_times(
    std::unique_ptr<TimeSequence> dates) const
{
  return expand(std::move(dates), _fn);
}


TimeRule TimeRules::at(int hour, int minute, int second) const
{
  if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 ||
      second > 59)
    THROW("invalid time of day " << hour << ":" << minute << ":" << second);

  return at(std::chrono::hours(hour) + std::chrono::minutes(minute) +
                std::chrono::seconds(second),
            _utc_offset);
}


TimeRule TimeRules::at(std::chrono::microseconds time_of_day,
                       std::chrono::minutes utc_offset) const
{
  if (time_of_day.count() < 0 || time_of_day >= one_day)
    THROW("time of day must lie within a single day");

  std::ostringstream oss;
  Time label(time_of_day);
  oss << label.strftime("%H:%M:%S");
  if (utc_offset.count())
    oss << " UTC" << (utc_offset.count() > 0 ? "+" : "-")
        << std::setw(2) << std::setfill('0') << std::abs(utc_offset.count()) / 60
        << ":" << std::setw(2) << std::abs(utc_offset.count()) % 60;

  return TimeRule(oss.str(), [time_of_day, utc_offset](Time date) {
    return std::vector<Time>{date + time_of_day - utc_offset};
  });
}


TimeRule TimeRules::every(std::chrono::microseconds interval) const
{
  if (interval.count() <= 0)
    THROW("Every time rule requires a positive interval");

  auto utc_offset = _utc_offset;
  std::ostringstream oss;
  oss << "Every " << std::chrono::duration_cast<std::chrono::seconds>(interval).count()
      << " seconds";

  return TimeRule(oss.str(), [interval, utc_offset](Time date) {
    std::vector<Time> times;
    for (std::chrono::microseconds tod{0}; tod < one_day; tod += interval)
      times.push_back(date + tod - utc_offset);
    return times;
  });
}


TimeRule TimeRules::after_market_open(const ExchangeHours& hours,
                                      std::chrono::minutes minutes_after) const
{
  ExchangeHours copy = hours;
  std::ostringstream oss;
  oss << "AfterMarketOpen: " << hours.name() << " " << minutes_after.count()
      << " min";

  return TimeRule(oss.str(), [copy, minutes_after](Time date) {
    std::vector<Time> times;
    if (copy.is_date_open(date))
      times.push_back(copy.market_open(date) + minutes_after);
    return times;
  });
}


TimeRule TimeRules::before_market_close(const ExchangeHours& hours,
                                        std::chrono::minutes minutes_before) const
{
  ExchangeHours copy = hours;
  std::ostringstream oss;
  oss << "BeforeMarketClose: " << hours.name() << " " << minutes_before.count()
      << " min";

  return TimeRule(oss.str(), [copy, minutes_before](Time date) {
    std::vector<Time> times;
    if (copy.is_date_open(date))
      times.push_back(copy.market_close(date) - minutes_before);
    return times;
  });
}


TimeRule TimeRules::midnight() const
{
  return TimeRule("Midnight", at(0).times_function());
}


TimeRule TimeRules::noon() const
{
  return TimeRule("Noon", at(12).times_function());
}


TimeRule TimeRules::combine(std::vector<TimeRule> rules)
{
  if (rules.empty())
    THROW("cannot combine an empty set of time rules");
  if (rules.size() == 1)
    return rules.front();

  std::string name;
  for (auto& rule : rules) {
    if (!name.empty())
      name += ",";
    name += rule.name();
  }

  return TimeRule(name, [rules](Time date) {
    std::vector<Time> times;
    for (auto& rule : rules) {
      auto more = rule.times(date);
      times.insert(times.end(), more.begin(), more.end());
    }
    std::sort(times.begin(), times.end());
    times.erase(std::unique(times.begin(), times.end()), times.end());
    return times;
  });
}

} // namespace tempo
