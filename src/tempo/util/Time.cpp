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

#include <tempo/util/Time.hpp>
#include <tempo/util/Error.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace tempo
{

namespace
{

struct Layout
{
  size_t length;
  char separator; // required character at offset 10, or 0 for any
  const char* format;
};

const Layout layouts[] = {
    {8, 0, "%Y%m%d"},
    {10, 0, "%Y-%m-%d"},
    {13, 0, "%Y%m%d-%H%M"},
    {15, 0, "%Y%m%d-%H%M%S"},
    {16, ' ', "%Y-%m-%d %H:%M"},
    {19, ' ', "%Y-%m-%d %H:%M:%S"},
    {19, 'T', "%Y-%m-%dT%H:%M:%S"},
};


std::chrono::microseconds parse_time(const std::string& s)
{
  std::string head = s;
  if (!head.empty() && head.back() == 'Z')
    head.pop_back();

  // optional fraction of a second, up to microseconds
  long fraction_us = 0;
  if (head.size() > 19 && head[19] == '.') {
    auto digits = head.substr(20);
    if (digits.empty() || digits.size() > 6)
      THROW("invalid fractional seconds in datetime '" << s << "'");
    for (char c : digits)
      if (!std::isdigit(static_cast<unsigned char>(c)))
        THROW("invalid fractional seconds in datetime '" << s << "'");
    digits.resize(6, '0');
    fraction_us = std::stol(digits);
    head.resize(19);
  }

  for (auto& layout : layouts) {
    if (layout.length != head.size())
      continue;
    if (layout.separator && head[10] != layout.separator)
      continue;

    struct tm parts = {};
    const char* end = strptime(head.c_str(), layout.format, &parts);
    if (end == nullptr || *end != '\0')
      THROW("failed to parse datetime '" << s << "'");
    auto seconds = std::chrono::seconds(timegm(&parts));
    return seconds + std::chrono::microseconds(fraction_us);
  }

  THROW("invalid datetime format for '" << s << "'");
}

} // namespace


Time::Time(const std::string& s) : _us(parse_time(s)) {}


Time Time::realtime_now()
{
  return Time(std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now().time_since_epoch()));
}


Time Time::end_of_time()
{
  return Time(std::chrono::seconds(253402300799) +
              std::chrono::microseconds(999999));
}


Time Time::from_date(int year, int month, int day)
{
  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month))
    THROW("invalid calendar date " << year << "-" << month << "-" << day);

  struct tm parts = {};
  parts.tm_year = year - 1900;
  parts.tm_mon = month - 1;
  parts.tm_mday = day;
  return Time(std::chrono::seconds(timegm(&parts)));
}


int Time::days_in_month(int year, int month)
{
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
  return (month == 2 && leap) ? 29 : days[month - 1];
}


std::time_t Time::epoch_seconds() const
{
  return std::chrono::floor<std::chrono::seconds>(_us).count();
}


std::chrono::microseconds Time::usec() const
{
  return _us - std::chrono::floor<std::chrono::seconds>(_us);
}


struct tm Time::tm_utc() const
{
  struct tm parts = {};
  std::time_t secs = epoch_seconds();
  gmtime_r(&secs, &parts);
  return parts;
}


Time Time::round_to_earliest_day() const
{
  using days = std::chrono::duration<int64_t, std::ratio<86400>>;
  return Time(std::chrono::floor<days>(_us));
}


std::chrono::microseconds Time::time_of_day() const
{
  return *this - round_to_earliest_day();
}


int Time::day_of_week() const { return tm_utc().tm_wday; }

int Time::day_of_month() const { return tm_utc().tm_mday; }

int Time::month() const { return tm_utc().tm_mon + 1; }

int Time::year() const { return tm_utc().tm_year + 1900; }


std::string Time::strftime(const char* format) const
{
  auto parts = tm_utc();
  std::ostringstream oss;
  oss << std::put_time(&parts, format);
  return oss.str();
}


std::string Time::as_iso8601(Resolution resolution) const
{
  std::ostringstream oss;
  oss << strftime("%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0');
  if (resolution == Resolution::micro)
    oss << std::setw(6) << usec().count();
  else
    oss << std::setw(3) << usec().count() / 1000;
  oss << "Z";
  return oss.str();
}


std::ostream& operator<<(std::ostream& os, const Time& t)
{
  return os << t.as_iso8601();
}

} // namespace tempo
