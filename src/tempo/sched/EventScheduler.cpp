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

#include <tempo/sched/EventScheduler.hpp>
#include <tempo/sched/BacktestEventScheduler.hpp>
#include <tempo/sched/LiveEventScheduler.hpp>
#include <tempo/util/Config.hpp>
#include <tempo/util/Error.hpp>

namespace tempo
{

SchedulerOptions SchedulerOptions::from_config(Config config)
{
  SchedulerOptions options;

  options.interval = std::chrono::milliseconds(
      config.get_uint("interval_ms", static_cast<uint64_t>(options.interval.count())));
  if (options.interval.count() == 0)
    throw ConfigError("scheduler interval_ms must be greater than zero");

  options.skip_past_events =
      config.get_bool("skip_past_events", options.skip_past_events);
  options.log_events = config.get_bool("log_events", options.log_events);

  return options;
}


std::unique_ptr<EventScheduler> create_event_scheduler(RunMode mode,
                                                       SchedulerOptions options)
{
  switch (mode) {
    case RunMode::backtest:
      return std::make_unique<BacktestEventScheduler>(std::move(options));
    case RunMode::live:
    case RunMode::paper: {
      auto scheduler = std::make_unique<LiveEventScheduler>(std::move(options));
      scheduler->start();
      return scheduler;
    }
  }
  THROW("unknown run mode " << static_cast<int>(mode));
}


std::unique_ptr<EventScheduler> create_event_scheduler(RunMode mode,
                                                       Config config)
{
  return create_event_scheduler(mode, SchedulerOptions::from_config(config));
}

} // namespace tempo
