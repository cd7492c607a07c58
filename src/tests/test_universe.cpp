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
#include <tempo/sched/BacktestEventScheduler.hpp>
#include <tempo/sched/LiveEventScheduler.hpp>
#include <tempo/sched/ScheduleManager.hpp>
#include <tempo/sched/UniverseScheduler.hpp>
#include <tempo/util/Error.hpp>

#include <atomic>
#include <thread>

using namespace std;
using namespace std::chrono_literals;

using tempo::BacktestEventScheduler;
using tempo::ExchangeHours;
using tempo::ScheduleManager;
using tempo::Security;
using tempo::SecurityChanges;
using tempo::Time;
using tempo::UniverseScheduler;

namespace
{

Time day(int y, int m, int d) { return Time::from_date(y, m, d); }

// Monday 3rd January 2000, midday UTC
const Time monday_noon = day(2000, 1, 3) + 12h;


class RecordingAlgorithm : public tempo::Algorithm
{
public:
  explicit RecordingAlgorithm(bool per_security) : _per_security(per_security) {}

  void on_end_of_day() override
  {
    algorithm_calls++;
    if (fail)
      throw std::runtime_error("algorithm failure");
  }

  void on_end_of_day(const std::string& symbol) override
  {
    security_calls.push_back(symbol);
    if (fail)
      throw std::runtime_error("oops");
  }

  bool handles_security_end_of_day() const override { return _per_security; }

  int algorithm_calls = 0;
  vector<string> security_calls;
  bool fail = false;

private:
  bool _per_security;
};


struct CountingAlgorithm : public tempo::Algorithm
{
  void on_end_of_day() override { ++calls; }

  std::atomic<int> calls{0};
};


Security us_security(string symbol)
{
  return Security{std::move(symbol), ExchangeHours::us_equity()};
}

} // namespace


TEST_CASE("security_end_of_day_follows_universe")
{
  RecordingAlgorithm algo(true);
  BacktestEventScheduler scheduler;
  scheduler.set_time(monday_noon);

  UniverseScheduler universe(scheduler, algo);
  universe.on_securities_changed({{us_security("SPY"), us_security("QQQ")}, {}});
  REQUIRE(scheduler.size() == 2);
  REQUIRE(universe.is_tracked("SPY"));

  // ten minutes before the 16:00 New York close
  scheduler.set_time(day(2000, 1, 3) + 20h + 49min);
  REQUIRE(algo.security_calls.empty());
  scheduler.set_time(day(2000, 1, 3) + 20h + 50min);
  REQUIRE(algo.security_calls == vector<string>({"SPY", "QQQ"}));

  // through Friday, then the weekend
  scheduler.set_time(day(2000, 1, 9));
  REQUIRE(algo.security_calls.size() == 10);

  universe.on_securities_changed({{}, {us_security("SPY")}});
  REQUIRE(scheduler.size() == 1);
  REQUIRE(!universe.is_tracked("SPY"));

  scheduler.set_time(day(2000, 1, 11));
  REQUIRE(algo.security_calls.size() == 11);
  REQUIRE(algo.security_calls.back() == "QQQ");

  // removing an untracked security has no effect
  REQUIRE_NOTHROW(universe.on_securities_changed({{}, {us_security("IBM")}}));
  REQUIRE(scheduler.size() == 1);
}


TEST_CASE("security_added_near_close_skips_that_close")
{
  RecordingAlgorithm algo(true);
  BacktestEventScheduler scheduler;
  scheduler.set_time(day(2000, 1, 3) + 20h + 55min);

  UniverseScheduler universe(scheduler, algo);
  universe.on_securities_changed({{us_security("SPY")}, {}});

  scheduler.set_time(day(2000, 1, 3) + 23h);
  REQUIRE(algo.security_calls.empty());
  scheduler.set_time(day(2000, 1, 4) + 21h);
  REQUIRE(algo.security_calls.size() == 1);
}


TEST_CASE("security_end_of_day_requires_capability")
{
  RecordingAlgorithm algo(false);
  BacktestEventScheduler scheduler;
  scheduler.set_time(monday_noon);

  UniverseScheduler universe(scheduler, algo);
  universe.on_securities_changed({{us_security("SPY")}, {}});
  REQUIRE(scheduler.size() == 0);
  REQUIRE(universe.security_count() == 1);

  scheduler.set_time(day(2000, 1, 8));
  REQUIRE(algo.security_calls.empty());
}


TEST_CASE("algorithm_end_of_day_on_trading_days")
{
  RecordingAlgorithm algo(false);
  BacktestEventScheduler scheduler;
  scheduler.set_time(day(2000, 1, 3));

  UniverseScheduler universe(scheduler, algo, -5h);
  universe.on_securities_changed({{us_security("SPY")}, {}});

  auto ev = universe.add_algorithm_end_of_day(day(2000, 1, 3), day(2000, 1, 10));
  REQUIRE(ev->name() == "Algorithm.EndOfDay");

  // 23:58 New York time is 04:58 UTC on the following day
  REQUIRE(ev->next_event_time() == day(2000, 1, 4) + 4h + 58min);

  scheduler.set_time(day(2000, 1, 10));
  REQUIRE(algo.algorithm_calls == 5);
  scheduler.set_time(day(2000, 1, 20));
  REQUIRE(algo.algorithm_calls == 5);
}


TEST_CASE("algorithm_end_of_day_without_securities")
{
  RecordingAlgorithm algo(false);
  BacktestEventScheduler scheduler;
  scheduler.set_time(day(2000, 1, 3));

  UniverseScheduler universe(scheduler, algo);
  universe.add_algorithm_end_of_day(day(2000, 1, 3), day(2000, 1, 9));

  scheduler.set_time(day(2000, 2, 1));
  REQUIRE(algo.algorithm_calls == 7);
}


TEST_CASE("glue_callback_errors_are_wrapped")
{
  RecordingAlgorithm algo(true);
  algo.fail = true;
  BacktestEventScheduler scheduler;
  scheduler.set_time(monday_noon);

  UniverseScheduler universe(scheduler, algo);
  universe.on_securities_changed({{us_security("SPY")}, {}});

  string message;
  try {
    scheduler.set_time(day(2000, 1, 4));
  } catch (const tempo::Error& e) {
    message = e.what();
  }
  REQUIRE(message == "Runtime error in SPY.EndOfDay event: oops");

  universe.on_securities_changed({{}, {us_security("SPY")}});
  universe.add_algorithm_end_of_day(day(2000, 1, 4), Time::end_of_time());
  try {
    scheduler.set_time(day(2000, 1, 5) + 1h);
  } catch (const tempo::Error& e) {
    message = e.what();
  }
  REQUIRE(message == "Runtime error in Algorithm.EndOfDay event: algorithm failure");
}


TEST_CASE("securities_require_current_time")
{
  RecordingAlgorithm algo(true);
  BacktestEventScheduler scheduler;
  UniverseScheduler universe(scheduler, algo);
  REQUIRE_THROWS_AS(universe.on_securities_changed({{us_security("SPY")}, {}}),
                    tempo::Error);
  REQUIRE(universe.security_count() == 0);
}


TEST_CASE("universe_changes_while_live_scheduler_runs")
{
  // each sample moves the clock a day on, so the end-of-day date filter is
  // evaluated on the scheduler thread while the universe changes
  std::atomic<int64_t> clock_us{monday_noon.as_epoch_us().count()};
  const int64_t one_day_us = std::chrono::microseconds(tempo::one_day).count();

  tempo::SchedulerOptions options;
  options.interval = 1ms;
  options.clock = [&clock_us, one_day_us]() {
    return Time(std::chrono::microseconds(clock_us.fetch_add(one_day_us)));
  };

  CountingAlgorithm algo;
  tempo::LiveEventScheduler scheduler(options);
  scheduler.set_time(monday_noon);
  UniverseScheduler universe(scheduler, algo);
  universe.add_algorithm_end_of_day(monday_noon, Time::end_of_time());
  scheduler.start();

  Security spy{"SPY", ExchangeHours::us_equity()};
  Security btc{"BTC", ExchangeHours::always_open()};
  for (int i = 0; i < 5000; ++i) {
    SecurityChanges added;
    added.added = {spy, btc};
    universe.on_securities_changed(added);

    SecurityChanges removed;
    removed.removed = {spy, btc};
    universe.on_securities_changed(removed);
  }

  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (algo.calls.load() == 0 && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(1ms);
  scheduler.sync_stop();

  REQUIRE(algo.calls.load() > 0);
  REQUIRE(scheduler.error_count() == 0);
  REQUIRE(universe.security_count() == 0);
}


TEST_CASE("schedule_manager_fluent_builder")
{
  BacktestEventScheduler scheduler;
  scheduler.set_time(monday_noon);
  ScheduleManager schedule(scheduler, -5h);

  vector<Time> fired;
  auto record = [&fired](const string&, Time t) { fired.push_back(t); };

  auto ev = schedule.event("open").every_day().at(9, 30).run(record);
  REQUIRE(ev->name() == "open");
  REQUIRE(ev->next_event_time() == day(2000, 1, 3) + 14h + 30min);
  REQUIRE(scheduler.contains(ev));

  scheduler.set_time(day(2000, 1, 5) + 15h);
  REQUIRE(fired == vector<Time>({day(2000, 1, 3) + 14h + 30min,
                                 day(2000, 1, 4) + 14h + 30min,
                                 day(2000, 1, 5) + 14h + 30min}));

  schedule.remove("open");
  REQUIRE(scheduler.size() == 0);
}


TEST_CASE("schedule_manager_rules")
{
  BacktestEventScheduler scheduler;
  scheduler.set_time(monday_noon);
  ScheduleManager schedule(scheduler, -5h);
  auto& dates = schedule.date_rules();
  auto& times = schedule.time_rules();
  auto noop = [](const string&, Time) {};

  auto ev = schedule.on(dates.every_day(), times.at(10, 0), noop);
  REQUIRE(ev->name() == "EveryDay: 10:00:00 UTC-05:00");
  REQUIRE(ev->next_event_time() == day(2000, 1, 3) + 15h);

  // times already past are skipped
  auto past = schedule.on(dates.every_day(), times.at(6, 0), noop);
  REQUIRE(past->next_event_time() == day(2000, 1, 4) + 11h);

  auto us = ExchangeHours::us_equity();
  auto close = schedule.event("close").every_day(us)
                   .before_market_close(us, 10min)
                   .run(noop);
  REQUIRE(close->next_event_time() == day(2000, 1, 3) + 20h + 50min);

  auto monthly = schedule.event("monthly").month_start().at(9, 45).run(noop);
  REQUIRE(monthly->next_event_time() == day(2000, 2, 1) + 14h + 45min);

  auto weekly = schedule.event("weekly").week_end().at(16).run(noop);
  REQUIRE(weekly->next_event_time() == day(2000, 1, 7) + 21h);
}


TEST_CASE("schedule_manager_date_rule_is_backdated")
{
  // local time is ahead of UTC, 22:00 on Monday 3rd
  BacktestEventScheduler scheduler;
  scheduler.set_time(monday_noon);
  ScheduleManager schedule(scheduler, 10h);

  auto ev = schedule.event("late").on(2000, 1, 3).at(23, 0).run(
      [](const string&, Time) {});
  REQUIRE(ev->next_event_time() == day(2000, 1, 3) + 13h);
}


TEST_CASE("schedule_builder_combines_and_filters")
{
  BacktestEventScheduler scheduler;
  scheduler.set_time(day(2000, 1, 3));
  ScheduleManager schedule(scheduler);

  vector<Time> fired;
  schedule.event("twice")
      .every(std::set<int>{1})
      .at(9)
      .at(15)
      .run([&fired](const string&, Time t) { fired.push_back(t); });

  schedule.event("filtered")
      .every_day()
      .every(6h)
      .where([](Time t) { return t.time_of_day() != 6h; })
      .run([&fired](const string&, Time t) { fired.push_back(t); });

  scheduler.set_time(day(2000, 1, 3) + 23h);
  REQUIRE(fired == vector<Time>({day(2000, 1, 3), day(2000, 1, 3) + 9h,
                                 day(2000, 1, 3) + 12h, day(2000, 1, 3) + 15h,
                                 day(2000, 1, 3) + 18h}));
}


TEST_CASE("schedule_builder_errors")
{
  BacktestEventScheduler scheduler;
  auto noop = [](const string&, Time) {};

  {
    ScheduleManager unset(scheduler);
    REQUIRE_THROWS_AS(unset.event("x").every_day().at(9).run(noop), tempo::Error);
  }

  scheduler.set_time(monday_noon);
  ScheduleManager schedule(scheduler);

  REQUIRE_THROWS_AS(schedule.event("x").at(9).run(noop), tempo::Error);
  REQUIRE_THROWS_AS(schedule.event("x").every_day().run(noop), tempo::Error);
  REQUIRE_THROWS_AS(schedule.event("x").every_day().month_end(), tempo::Error);
  REQUIRE_THROWS_AS(schedule.event("x").month_start(20), tempo::Error);
  REQUIRE(scheduler.size() == 0);
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
