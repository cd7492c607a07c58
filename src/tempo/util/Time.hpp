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

#include <chrono>
#include <ctime>
#include <iosfwd>
#include <string>

namespace tempo
{

/* UTC point in time, held as microseconds since the unix epoch.  A default
 * constructed Time is the epoch and is treated as "not set"; end_of_time()
 * is the "never" sentinel. */
class Time
{
public:
  enum class Resolution { milli, micro };

  Time() = default;
  explicit Time(std::chrono::microseconds since_epoch) : _us(since_epoch) {}

  /* Accepts "YYYYMMDD", "YYYY-MM-DD", "YYYYMMDD-HHMM[SS]",
   * "YYYY-MM-DD HH:MM" and "YYYY-MM-DD[T ]HH:MM:SS[.ffffff][Z]" */
  explicit Time(const std::string& s);
  explicit Time(const char* s) : Time(std::string(s)) {}

  /* Wall-clock time, never the simulation time; code that may run in a
   * backtest must ask its scheduler instead. */
  static Time realtime_now();

  /* 9999-12-31T23:59:59.999999Z */
  static Time end_of_time();

  /* Midnight UTC of the given calendar date; month and day are 1-based. */
  static Time from_date(int year, int month, int day);

  static int days_in_month(int year, int month);

  [[nodiscard]] std::chrono::microseconds as_epoch_us() const { return _us; }

  [[nodiscard]] bool empty() const { return _us.count() == 0; }
  [[nodiscard]] bool is_end_of_time() const { return *this == end_of_time(); }

  Time& operator+=(std::chrono::microseconds d)
  {
    _us += d;
    return *this;
  }
  Time& operator-=(std::chrono::microseconds d)
  {
    _us -= d;
    return *this;
  }

  bool operator==(const Time& o) const { return _us == o._us; }
  bool operator!=(const Time& o) const { return _us != o._us; }
  bool operator<(const Time& o) const { return _us < o._us; }
  bool operator<=(const Time& o) const { return _us <= o._us; }
  bool operator>(const Time& o) const { return _us > o._us; }
  bool operator>=(const Time& o) const { return _us >= o._us; }

  /* "2017-05-21T07:51:17.000Z" or, for micro, "2017-05-21T07:51:17.000000Z" */
  [[nodiscard]] std::string as_iso8601(Resolution = Resolution::milli) const;

  /* Microsecond part of the current second */
  [[nodiscard]] std::chrono::microseconds usec() const;

  /* Midnight UTC of the same day */
  [[nodiscard]] Time round_to_earliest_day() const;

  /* Elapsed time since the start of the UTC day */
  [[nodiscard]] std::chrono::microseconds time_of_day() const;

  /* Calendar fields of the UTC date. Day of week counts from Sunday = 0. */
  [[nodiscard]] int day_of_week() const;
  [[nodiscard]] int day_of_month() const;
  [[nodiscard]] int month() const;
  [[nodiscard]] int year() const;

  [[nodiscard]] std::string strftime(const char* format) const;

private:
  [[nodiscard]] std::time_t epoch_seconds() const;
  [[nodiscard]] struct tm tm_utc() const;

  std::chrono::microseconds _us{0};
};


inline Time operator+(Time t, std::chrono::microseconds d) { return t += d; }

inline Time operator-(Time t, std::chrono::microseconds d) { return t -= d; }

inline std::chrono::microseconds operator-(const Time& a, const Time& b)
{
  return a.as_epoch_us() - b.as_epoch_us();
}

std::ostream& operator<<(std::ostream&, const Time&);

constexpr std::chrono::hours one_day{24};

} // namespace tempo
