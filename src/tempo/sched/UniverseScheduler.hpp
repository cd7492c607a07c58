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

#include <tempo/sched/EventScheduler.hpp>
#include <tempo/sched/ExchangeHours.hpp>
#include <tempo/sched/ScheduledEvent.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tempo
{

/* End-of-day hooks of a trading algorithm */
class Algorithm
{
public:
  virtual ~Algorithm() = default;

  virtual void on_end_of_day() {}

  virtual void on_end_of_day(const std::string& /* symbol */) {}

  /* Whether the algorithm wants per security end-of-day events */
  virtual bool handles_security_end_of_day() const { return false; }
};


struct Security
{
  std::string symbol;
  ExchangeHours hours;
};


struct SecurityChanges
{
  std::vector<Security> added;
  std::vector<Security> removed;
};


/* Maintains the end-of-day events of an algorithm as securities enter and
 * leave its universe.  The algorithm must outlive the events created. */
class UniverseScheduler
{
public:
  static constexpr const char* end_of_day_name = "EndOfDay";
  static constexpr const char* algorithm_scope = "Algorithm";

  UniverseScheduler(EventScheduler& scheduler, Algorithm& algo,
                    std::chrono::minutes algorithm_utc_offset = std::chrono::minutes(0));

  UniverseScheduler(const UniverseScheduler&) = delete;
  UniverseScheduler& operator=(const UniverseScheduler&) = delete;

  /* Add a "SYMBOL.EndOfDay" event for each added security, firing before each
   * market close from the current time onwards, and remove the event of each
   * removed security. */
  void on_securities_changed(const SecurityChanges& changes);

  /* Add the "Algorithm.EndOfDay" event, firing shortly before local midnight
   * on each day between `start` and `end` on which any tracked exchange
   * trades, or on every day if no exchange is tracked. */
  std::shared_ptr<ScheduledEvent> add_algorithm_end_of_day(Time start, Time end);

  [[nodiscard]] size_t security_count() const { return _securities.size(); }

  [[nodiscard]] bool is_tracked(const std::string& symbol) const
  {
    return _securities.count(symbol) != 0;
  }

private:
  struct TrackedExchange
  {
    ExchangeHours hours;
    int securities;
  };

  /* Exchanges of the tracked securities.  Shared with the algorithm
   * end-of-day date filter, which reads it on the scheduler thread. */
  struct ExchangeRegistry
  {
    std::mutex mutex;
    std::map<std::string, TrackedExchange> exchanges;

    void track(const ExchangeHours& hours);
    void untrack(const std::string& name);
    bool any_open(Time date);
  };

  void add_security(const Security&);
  void remove_security(const Security&);

  EventScheduler& _scheduler;
  Algorithm& _algo;
  bool _handles_security_end_of_day;
  std::chrono::minutes _utc_offset;
  std::map<std::string, Security> _securities;
  std::shared_ptr<ExchangeRegistry> _exchanges;
};

} // namespace tempo
