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

#include <tempo/core/Logger.hpp>
#include <tempo/sched/EventScheduler.hpp>
#include <tempo/sched/ExchangeHours.hpp>
#include <tempo/sched/ScheduleManager.hpp>
#include <tempo/sched/UniverseScheduler.hpp>
#include <tempo/util/Config.hpp>
#include <tempo/util/Error.hpp>
#include <tempo/util/json.hpp>

#include <cstring>
#include <iostream>
#include <map>

using namespace std::chrono_literals;

namespace
{

tempo::Config load_config(const std::string& filename)
{
  try {
    json raw_config = tempo::read_json_config_file(filename);
    return tempo::Config(raw_config);
  } catch (const std::exception& e) {
    THROW("error reading config file '" << filename << "': " << e.what());
  }
}


/* Algorithm that just logs its end-of-day notifications */
class LoggingAlgorithm : public tempo::Algorithm
{
public:
  void on_end_of_day() override { LOG_INFO("algorithm end of day"); }

  void on_end_of_day(const std::string& symbol) override
  {
    LOG_INFO("end of day for " << symbol);
  }

  bool handles_security_end_of_day() const override { return true; }
};


class SchedulerDemo
{
public:
  explicit SchedulerDemo(tempo::Config config)
    : _config(std::move(config)),
      _run_mode(tempo::parse_run_mode(_config.get_string("run_mode"))),
      _utc_offset(_config.get_int("utc_offset_minutes", 0))
  {
  }

  void run()
  {
    tempo::Logger::instance().log_banner(_run_mode);

    auto scheduler_config =
        _config.get_sub_config("scheduler", tempo::Config::empty_config());
    _scheduler = tempo::create_event_scheduler(_run_mode, scheduler_config);

    if (!tempo::is_realtime(_run_mode)) {
      _backtest_from = Time(_config.get_sub_config("backtest").get_string("from"));
      _backtest_upto = Time(_config.get_sub_config("backtest").get_string("upto"));
      if (_backtest_upto < _backtest_from)
        throw tempo::ConfigError("backtest 'upto' is before 'from'");

      auto* scheduler = _scheduler.get();
      tempo::Logger::instance().set_clock_source(
          [scheduler]() { return scheduler->current_time(); });
      _scheduler->set_time(_backtest_from);
    } else {
      // rules need a current time before the sampling thread first runs
      _scheduler->set_time(Time::realtime_now());
    }

    load_exchanges();

    tempo::ScheduleManager schedule(*_scheduler, _utc_offset);
    tempo::UniverseScheduler universe(*_scheduler, _algo, _utc_offset);

    add_securities(universe);
    add_events(schedule);

    universe.add_algorithm_end_of_day(_scheduler->current_time(),
                                      Time::end_of_time());

    LOG_INFO("scheduler has " << _scheduler->size() << " events, next at "
                              << _scheduler->next_event_time());

    if (!tempo::is_realtime(_run_mode)) {
      run_backtest();
      tempo::Logger::instance().set_clock_source({});
    } else {
      tempo::wait_for_sigint();
      LOG_INFO("control-c pressed, scheduler will stop");
      _scheduler->sync_stop();
    }

    LOG_INFO("*** scheduler demo stopping ***");
  }

private:
  using Time = tempo::Time;

  void load_exchanges()
  {
    if (!_config.has_field("exchanges"))
      return;
    auto exchanges = _config.get_sub_config("exchanges");
    for (size_t i = 0; i < exchanges.array_size(); ++i) {
      auto hours = tempo::ExchangeHours::from_config(exchanges.array_item(i));
      LOG_INFO("loaded exchange " << hours.name());
      _exchanges.emplace(hours.name(), std::move(hours));
    }
  }


  const tempo::ExchangeHours& exchange(const std::string& name) const
  {
    auto iter = _exchanges.find(name);
    if (iter == _exchanges.end())
      throw tempo::ConfigError("unknown exchange '" + name + "'");
    return iter->second;
  }


  void add_securities(tempo::UniverseScheduler& universe)
  {
    if (!_config.has_field("securities"))
      return;
    tempo::SecurityChanges changes;
    auto securities = _config.get_sub_config("securities");
    for (size_t i = 0; i < securities.array_size(); ++i) {
      auto item = securities.array_item(i);
      changes.added.push_back(tempo::Security{
          item.get_string("symbol"), exchange(item.get_string("exchange"))});
    }
    universe.on_securities_changed(changes);
  }


  void add_events(tempo::ScheduleManager& schedule)
  {
    auto log_fire = [](const std::string& name, Time t) {
      LOG_INFO("event '" << name << "' fired for " << t);
    };

    schedule.event("rebalance").month_start().at(9, 45).run(log_fire);
    schedule.event("weekly-report").week_end().at(17).run(log_fire);

    if (_exchanges.empty())
      return;

    auto& hours = _exchanges.begin()->second;
    schedule.event("pre-close")
        .every_day(hours)
        .before_market_close(hours, 15min)
        .run(log_fire);

    auto heartbeat = _config.get_int("heartbeat_minutes", 0);
    if (heartbeat > 0)
      schedule.event("heartbeat")
          .every_day(hours)
          .every(std::chrono::minutes(heartbeat))
          .where([hours](Time t) {
            return hours.is_date_open(hours.local_date(t)) &&
                   t >= hours.market_open(hours.local_date(t)) &&
                   t <= hours.market_close(hours.local_date(t));
          })
          .run(log_fire);
  }


  void run_backtest()
  {
    LOG_INFO("backtest from " << _backtest_from << " upto " << _backtest_upto);
    size_t steps = 0;
    while (true) {
      Time next = _scheduler->next_event_time();
      if (next > _backtest_upto)
        break;
      _scheduler->set_time(next);
      ++steps;
    }
    _scheduler->set_time(_backtest_upto);
    LOG_INFO("backtest complete, " << steps << " time steps");
  }

  tempo::Config _config;
  tempo::RunMode _run_mode;
  std::chrono::minutes _utc_offset;
  Time _backtest_from;
  Time _backtest_upto;
  std::map<std::string, tempo::ExchangeHours> _exchanges;
  LoggingAlgorithm _algo;
  std::unique_ptr<tempo::EventScheduler> _scheduler;
};


struct cmd_line_args {
  std::string config_file;
};


void die(const char* msg)
{
  std::cerr << "error: " << msg << "\n";
  std::cerr << "try --help\n";
  exit(1);
}


void help()
{
  std::cout << "options" << std::endl;
  std::cout << " --config CONFIG    config file" << std::endl;
  exit(0);
}


cmd_line_args parse_args(int argc, char** argv)
{
  cmd_line_args args;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--config") == 0) {
      if (++i >= argc)
        die("missing arg, config file");
      args.config_file = argv[i];
    } else if ((strcmp(argv[i], "-h") == 0) ||
               (strcmp(argv[i], "--help") == 0)) {
      help();
    } else {
      die("unknown option");
    }
  }

  if (args.config_file.empty())
    throw std::runtime_error("config file not specified");
  return args;
}

} // namespace


int main(int argc, char** argv)
{
  cmd_line_args args;
  try {
    args = parse_args(argc, argv);
  } catch (std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  try {
    tempo::Logger::instance().set_is_configured(false);
    tempo::Logger::instance().register_thread_id("main");

    auto root_config = load_config(args.config_file);
    tempo::Logger::configure_from_config(
        root_config.get_sub_config("logging", tempo::Config::empty_config()));
    LOG_NOTICE("application config file '" << args.config_file << "'");

    SchedulerDemo demo(root_config);
    demo.run();
    return 0;
  }

  catch (tempo::ConfigError& e) {
    if (tempo::Logger::instance().is_configured())
      LOG_ERROR("config-error: " << e.what());
    std::cerr << "config-error: " << e.what() << std::endl;
  }

  catch (std::exception& e) {
    if (tempo::Logger::instance().is_configured())
      LOG_ERROR(e.what());
    std::cerr << e.what() << std::endl;
  }

  return 1;
}
