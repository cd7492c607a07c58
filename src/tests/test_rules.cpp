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

#include "quicktest.hpp"

#include <tempo/core/Logger.hpp>
#include <tempo/sched/DateRules.hpp>
#include <tempo/sched/ExchangeHours.hpp>
#include <tempo/sched/TimeRules.hpp>
#include <tempo/sched/TimeSequence.hpp>
#include <tempo/util/Config.hpp>
#include <tempo/util/Error.hpp>

#include <stdlib.h>

using namespace std;
using namespace std::chrono_literals;

using tempo::DateRules;
using tempo::ExchangeHours;
using tempo::Time;
using tempo::TimeRules;

namespace
{

const Time y2000 = Time::from_date(2000, 1, 1);
const Time y2000_end = Time::from_date(2000, 12, 31);

vector<Time> all(unique_ptr<tempo::TimeSequence> seq)
{
  return tempo::take(*seq, 100000);
}

Time day(int y, int m, int d) { return Time::from_date(y, m, d); }

} // namespace


TEST_CASE("time_calendar_helpers")
{
  REQUIRE(Time::days_in_month(2000, 2) == 29);
  REQUIRE(Time::days_in_month(1900, 2) == 28);
  REQUIRE(Time::days_in_month(2023, 2) == 28);
  REQUIRE(Time::days_in_month(2024, 4) == 30);
  REQUIRE_THROWS_AS(Time::from_date(2000, 2, 30), tempo::Error);
  REQUIRE_THROWS_AS(Time::from_date(2000, 13, 1), tempo::Error);

  REQUIRE(y2000.day_of_week() == 6);
  REQUIRE(day(2000, 1, 3).day_of_week() == 1);
  REQUIRE(day(2024, 2, 29).day_of_month() == 29);
  REQUIRE(day(2024, 2, 29).month() == 2);
  REQUIRE(day(2024, 2, 29).year() == 2024);

  Time t = day(2000, 1, 3) + 9h + 30min + 15s;
  REQUIRE(t.time_of_day() == 9h + 30min + 15s);
  REQUIRE(t.round_to_earliest_day() == day(2000, 1, 3));
  REQUIRE(t - day(2000, 1, 3) == 9h + 30min + 15s);

  REQUIRE(Time::end_of_time() > day(9999, 12, 31));
  REQUIRE(Time::end_of_time().is_end_of_time());
  REQUIRE(Time().empty());
}


TEST_CASE("time_parse_and_format")
{
  REQUIRE(Time("2000-01-03") == day(2000, 1, 3));
  REQUIRE(Time("20000103") == day(2000, 1, 3));
  REQUIRE(Time("2000-01-03T09:30:00") == day(2000, 1, 3) + 9h + 30min);
  REQUIRE(Time("2000-01-03 09:30") == day(2000, 1, 3) + 9h + 30min);
  REQUIRE(Time("2000-01-03T09:30:00.250Z") == day(2000, 1, 3) + 9h + 30min + 250ms);

  REQUIRE(day(2000, 1, 3).as_iso8601() == "2000-01-03T00:00:00.000Z");
  REQUIRE((day(2000, 1, 3) + 1500us).as_iso8601(Time::Resolution::micro) ==
          "2000-01-03T00:00:00.001500Z");

  REQUIRE_THROWS_AS(Time("not a time"), tempo::Error);
  REQUIRE_THROWS_AS(Time("2000-xx-03"), tempo::Error);
}


TEST_CASE("time_sequences")
{
  auto list = tempo::make_time_sequence({day(2000, 1, 1), day(2000, 1, 2)});
  REQUIRE(list->next() == day(2000, 1, 1));
  REQUIRE(list->next() == day(2000, 1, 2));
  REQUIRE(list->next().is_end_of_time());
  REQUIRE(list->next().is_end_of_time());

  int calls = 0;
  auto gen = tempo::make_generator([&calls]() {
    ++calls;
    return calls <= 3 ? day(2000, 1, calls) : Time::end_of_time();
  });
  REQUIRE(all(std::move(gen)).size() == 3);
  REQUIRE(calls == 4);

  Time cursor = y2000;
  auto odd_days = tempo::filter(
      tempo::make_generator([&cursor]() {
        Time t = cursor;
        cursor += 24h;
        return t;
      }),
      [](Time t) { return t.day_of_month() % 2 == 1; });
  auto first = tempo::take(*odd_days, 3);
  REQUIRE(first == vector<Time>({day(2000, 1, 1), day(2000, 1, 3), day(2000, 1, 5)}));

  auto twice_daily = tempo::expand(
      tempo::make_time_sequence({day(2000, 1, 1), day(2000, 1, 2)}),
      [](Time d) { return vector<Time>{d + 1h, d + 2h}; });
  REQUIRE(all(std::move(twice_daily)).size() == 4);
}


TEST_CASE("exchange_hours_us_equity")
{
  auto us = ExchangeHours::us_equity();
  REQUIRE(us.utc_offset() == -5h);
  REQUIRE(us.is_date_open(day(2000, 1, 3)));
  REQUIRE(!us.is_date_open(day(2000, 1, 1)));
  REQUIRE_THROWS_AS(us.market_open(day(2000, 1, 1)), tempo::Error);

  REQUIRE(us.market_open(day(2000, 1, 3)) == day(2000, 1, 3) + 14h + 30min);
  REQUIRE(us.market_close(day(2000, 1, 3)) == day(2000, 1, 3) + 21h);

  // Friday 7th January 2000
  Time friday_close = day(2000, 1, 7) + 21h;
  REQUIRE(us.next_market_close(friday_close - 1h) == friday_close);
  REQUIRE(us.next_market_close(friday_close) == day(2000, 1, 10) + 21h);
  REQUIRE(us.next_market_close(day(2000, 1, 8) + 3h) == day(2000, 1, 10) + 21h);

  // just after midnight UTC is still the previous local date
  REQUIRE(us.local_date(day(2000, 1, 4) + 2h) == day(2000, 1, 3));

  us.add_holiday(day(2000, 1, 10));
  us.add_early_close(day(2000, 1, 11), 13h);
  REQUIRE(us.next_market_close(friday_close) == day(2000, 1, 11) + 18h);
  REQUIRE(us.next_open_date(day(2000, 1, 8)) == day(2000, 1, 11));
  REQUIRE(us.previous_open_date(day(2000, 1, 10)) == day(2000, 1, 7));

  REQUIRE_THROWS_AS(us.add_early_close(day(2000, 1, 12), 17h), tempo::Error);
  REQUIRE_THROWS_AS(ExchangeHours("bad", 0min, 10h, 9h), tempo::Error);
  REQUIRE_THROWS_AS(ExchangeHours("bad", 0min, 9h, 10h, {}), tempo::Error);
}


TEST_CASE("exchange_hours_from_config")
{
  auto config = tempo::Config(json::parse(R"({
    "name": "lse",
    "utc_offset_minutes": 0,
    "open": "08:00",
    "close": "16:30",
    "weekdays": [1, 2, 3, 4, 5],
    "holidays": ["2000-01-03"],
    "early_closes": {"2000-01-04": "12:30"}
  })"));

  auto lse = ExchangeHours::from_config(config);
  REQUIRE(lse.name() == "lse");
  REQUIRE(lse.open_time() == 8h);
  REQUIRE(lse.close_time() == 16h + 30min);
  REQUIRE(!lse.is_date_open(day(2000, 1, 3)));
  REQUIRE(lse.market_close(day(2000, 1, 4)) == day(2000, 1, 4) + 12h + 30min);
  REQUIRE(lse.market_close(day(2000, 1, 5)) == day(2000, 1, 5) + 16h + 30min);

  REQUIRE(tempo::parse_time_of_day("09:30") == 570min);
  REQUIRE_THROWS_AS(tempo::parse_time_of_day("9:3x"), tempo::ConfigError);
  REQUIRE_THROWS_AS(tempo::parse_time_of_day("25:00"), tempo::ConfigError);
  REQUIRE_THROWS_AS(tempo::parse_time_of_day("0930"), tempo::ConfigError);

  auto missing = tempo::Config(json::parse(R"({"open": "08:00", "close": "16:00"})"));
  REQUIRE_THROWS_AS(ExchangeHours::from_config(missing),
                    tempo::MissingFieldConfigError);

  auto bad_type = tempo::Config(json::parse(
      R"({"name": "x", "open": 8, "close": "16:00"})"));
  REQUIRE_THROWS_AS(ExchangeHours::from_config(bad_type), tempo::ConfigError);
}


TEST_CASE("config_getters")
{
  setenv("TEMPO_TEST_HOME", "/opt/tempo", 1);
  auto config = tempo::Config(json::parse(R"({
    "path": "${TEMPO_TEST_HOME}/data",
    "count": 3,
    "offset": -300,
    "flag": true,
    "sub": {"x": "y"},
    "list": ["a", "b"]
  })"));

  REQUIRE(config.get_string("path") == "/opt/tempo/data");
  REQUIRE(config.get_uint("count") == 3);
  REQUIRE(config.get_int("offset") == -300);
  REQUIRE(config.get_bool("flag"));
  REQUIRE(config.get_bool("absent", false) == false);
  REQUIRE(config.get_string("absent", "default") == "default");
  REQUIRE(config.get_sub_config("sub").get_string("x") == "y");
  REQUIRE(config.get_sub_config("list").array_size() == 2);
  REQUIRE(config.get_sub_config("list").get_string(1) == "b");
  REQUIRE(config.has_field("sub"));
  REQUIRE(!config.has_field("nope"));
  REQUIRE(config.get_sub_config("sub").field_names() == vector<string>({"x"}));

  REQUIRE_THROWS_AS(config.get_string("missing"), tempo::MissingFieldConfigError);
  REQUIRE_THROWS_AS(config.get_uint("offset"), tempo::ConfigError);
  REQUIRE_THROWS_AS(config.get_bool("count"), tempo::ConfigError);
}


TEST_CASE("date_rules_every_day_and_weekdays")
{
  DateRules rules;
  REQUIRE(all(rules.every_day().dates(y2000, y2000_end)).size() == 366);
  REQUIRE(all(rules.every_day(ExchangeHours::always_open()).dates(y2000, y2000_end)).size() == 366);

  auto trading = all(rules.every_day(ExchangeHours::us_equity()).dates(y2000, y2000_end));
  REQUIRE(trading.size() == 260);
  REQUIRE(trading.front() == day(2000, 1, 3));
  REQUIRE(trading.back() == day(2000, 12, 29));

  auto mondays = all(rules.every({1}).dates(y2000, y2000_end));
  REQUIRE(mondays.size() == 52);
  REQUIRE(mondays.front() == day(2000, 1, 3));
  REQUIRE(rules.every({1, 5}).name() == "Every Monday,Friday");
  REQUIRE_THROWS_AS(rules.every({}), tempo::Error);
  REQUIRE_THROWS_AS(rules.every({7}), tempo::Error);

  // a start time within a day still includes that date
  auto days = all(rules.every_day().dates(day(2000, 1, 5) + 13h, day(2000, 1, 7)));
  REQUIRE(days == vector<Time>({day(2000, 1, 5), day(2000, 1, 6), day(2000, 1, 7)}));
  REQUIRE(all(rules.every_day().dates(day(2000, 1, 7), day(2000, 1, 5))).empty());

  // unbounded series are produced lazily
  auto forever = rules.every_day().dates(y2000, Time::end_of_time());
  REQUIRE(tempo::take(*forever, 400).size() == 400);
}


TEST_CASE("date_rules_month_start_and_end")
{
  DateRules rules;
  auto us = ExchangeHours::us_equity();

  auto starts = all(rules.month_start().dates(y2000, y2000_end));
  REQUIRE(starts.size() == 12);
  REQUIRE(starts.front() == day(2000, 1, 1));
  REQUIRE(starts.back() == day(2000, 12, 1));

  auto trading_starts = all(rules.month_start(us).dates(y2000, y2000_end));
  REQUIRE(trading_starts.size() == 12);
  REQUIRE(trading_starts.front() == day(2000, 1, 3));
  REQUIRE(rules.month_start(us).name() == "us_equity: MonthStart");
  REQUIRE(rules.month_start(2).name() == "MonthStart+2");
  REQUIRE(all(rules.month_start(2).dates(y2000, y2000_end)).front() == day(2000, 1, 3));

  auto ends = all(rules.month_end().dates(y2000, y2000_end));
  REQUIRE(ends.size() == 12);
  REQUIRE(ends[0] == day(2000, 1, 31));
  REQUIRE(ends[1] == day(2000, 2, 29));

  // 30th April 2000 is a Sunday
  auto trading_ends = all(rules.month_end(us).dates(y2000, y2000_end));
  REQUIRE(trading_ends[3] == day(2000, 4, 28));
  REQUIRE(all(rules.month_end(1).dates(y2000, y2000_end))[1] == day(2000, 2, 28));

  // the first date is not before the start of the range
  auto mid = all(rules.month_start().dates(day(2000, 1, 15), y2000_end));
  REQUIRE(mid.size() == 11);
  REQUIRE(mid.front() == day(2000, 2, 1));

  REQUIRE_THROWS_AS(rules.month_start(16), tempo::Error);
  REQUIRE_THROWS_AS(rules.month_end(-1), tempo::Error);
  REQUIRE_NOTHROW(rules.month_end(15));
}


TEST_CASE("date_rules_week_start_and_end")
{
  DateRules rules;
  auto us = ExchangeHours::us_equity();

  auto starts = all(rules.week_start().dates(y2000, y2000_end));
  REQUIRE(starts.size() == 52);
  REQUIRE(starts.front() == day(2000, 1, 3));

  auto ends = all(rules.week_end().dates(y2000, y2000_end));
  REQUIRE(ends.size() == 52);
  REQUIRE(ends.front() == day(2000, 1, 7));
  REQUIRE(ends.back() == day(2000, 12, 29));

  REQUIRE(all(rules.week_start(2).dates(y2000, y2000_end)).front() == day(2000, 1, 5));
  REQUIRE(all(rules.week_end(4).dates(y2000, y2000_end)).front() == day(2000, 1, 3));

  us.add_holiday(day(2000, 1, 7));
  us.add_holiday(day(2000, 1, 10));
  REQUIRE(all(rules.week_end(us).dates(y2000, y2000_end)).front() == day(2000, 1, 6));
  REQUIRE(all(rules.week_start(us).dates(day(2000, 1, 8), y2000_end)).front() == day(2000, 1, 11));

  REQUIRE_THROWS_AS(rules.week_start(5), tempo::Error);
  REQUIRE_THROWS_AS(rules.week_end(-1), tempo::Error);
}


TEST_CASE("date_rules_on_today_tomorrow")
{
  DateRules rules([]() { return day(2000, 1, 3) + 3h; }, -5h);

  auto on = rules.on(2000, 2, 29);
  REQUIRE(on.name() == "On 2000-02-29");
  REQUIRE(all(on.dates(y2000, y2000_end)) == vector<Time>({day(2000, 2, 29)}));
  REQUIRE(all(on.dates(day(2000, 3, 1), y2000_end)).empty());
  REQUIRE_THROWS_AS(rules.on(2001, 2, 29), tempo::Error);

  auto several = rules.on({day(2000, 3, 1) + 5h, day(2000, 1, 2), day(2000, 1, 2)});
  REQUIRE(all(several.dates(y2000, y2000_end)) ==
          vector<Time>({day(2000, 1, 2), day(2000, 3, 1)}));

  // 03:00 UTC is still the 2nd locally
  REQUIRE(all(rules.today().dates(y2000, y2000_end)) == vector<Time>({day(2000, 1, 2)}));
  REQUIRE(all(rules.tomorrow().dates(y2000, y2000_end)) == vector<Time>({day(2000, 1, 3)}));
}


TEST_CASE("time_rules")
{
  TimeRules rules(-5h);
  Time monday = day(2000, 1, 3);
  Time saturday = day(2000, 1, 1);
  auto us = ExchangeHours::us_equity();

  REQUIRE(rules.at(9, 30).times(monday) == vector<Time>({monday + 14h + 30min}));
  REQUIRE(rules.at(9, 30).name() == "09:30:00 UTC-05:00");
  REQUIRE(rules.at(9h, 0min).times(monday) == vector<Time>({monday + 9h}));
  REQUIRE_THROWS_AS(rules.at(24), tempo::Error);
  REQUIRE_THROWS_AS(rules.at(1, 60), tempo::Error);

  TimeRules utc;
  REQUIRE(utc.every(6h).times(monday) ==
          vector<Time>({monday, monday + 6h, monday + 12h, monday + 18h}));
  REQUIRE(utc.every(90min).times(monday).size() == 16);
  REQUIRE_THROWS_AS(utc.every(0s), tempo::Error);

  REQUIRE(rules.after_market_open(us, 30min).times(monday) ==
          vector<Time>({monday + 15h}));
  REQUIRE(rules.after_market_open(us).times(saturday).empty());
  REQUIRE(rules.before_market_close(us, 10min).times(monday) ==
          vector<Time>({monday + 20h + 50min}));

  us.add_early_close(monday, 13h);
  REQUIRE(rules.before_market_close(us, 10min).times(monday) ==
          vector<Time>({monday + 17h + 50min}));

  REQUIRE(utc.midnight().times(monday) == vector<Time>({monday}));
  REQUIRE(utc.noon().times(monday) == vector<Time>({monday + 12h}));
  REQUIRE(utc.noon().name() == "Noon");

  auto combined = TimeRules::combine({utc.at(9), utc.at(8), utc.at(9)});
  REQUIRE(combined.times(monday) == vector<Time>({monday + 8h, monday + 9h}));
  REQUIRE_THROWS_AS(TimeRules::combine({}), tempo::Error);
}


TEST_CASE("date_and_time_rules_compose")
{
  DateRules dates;
  TimeRules times(-5h);
  auto us = ExchangeHours::us_equity();

  auto seq = times.before_market_close(us, 10min)
                 .create_utc_times(dates.every_day().dates(y2000, day(2000, 1, 10)));
  auto utc = all(std::move(seq));

  // weekends produce no times
  REQUIRE(utc.size() == 6);
  REQUIRE(utc.front() == day(2000, 1, 3) + 20h + 50min);
  REQUIRE(utc.back() == day(2000, 1, 10) + 20h + 50min);
}


int main(int argc, char** argv)
{
  try {
    tempo::Logger::instance().set_level(tempo::Logger::level::warn);
    int result = quicktest::run(argc, argv);
    return (result < 0xFF ? result : 0xFF);
  } catch (exception& e) {
    cout << e.what() << endl;
    return 1;
  }
}
