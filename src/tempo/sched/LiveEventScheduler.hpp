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

#include <tempo/sched/EventQueue.hpp>
#include <tempo/sched/EventScheduler.hpp>
#include <tempo/util/StopFlag.hpp>
#include <tempo/util/utils.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

namespace tempo
{

/* Scheduler paced by a clock, sampled by a background thread once per
 * interval.
 *
 * All access is serialised by a single recursive mutex, which is also held
 * while callbacks run, so a callback may add and remove events.  An exception
 * from a callback is logged, counted and passed to the optional error handler,
 * and scanning then continues with the remaining events. */
class LiveEventScheduler : public EventScheduler
{
public:
  /* Receives the failed event and a description of the exception */
  typedef std::function<void(const ScheduledEvent&, const std::string&)> error_fn;

  explicit LiveEventScheduler(SchedulerOptions options = {},
                              error_fn on_error = {});
  LiveEventScheduler(const LiveEventScheduler&) = delete;
  LiveEventScheduler& operator=(const LiveEventScheduler&) = delete;
  ~LiveEventScheduler();

  /* Start the sampling thread; can be called only once */
  void start();

  /** Perform synchronous stop of the sampling thread.  On return, the thread
   * will have been joined, unless called from the thread itself. */
  void sync_stop() override;

  void add(std::shared_ptr<ScheduledEvent>) override;
  void remove(const std::shared_ptr<ScheduledEvent>&) override;
  void remove(const std::string& name) override;

  /* Fire due events. A time earlier than the current time is ignored. */
  void set_time(Time now) override;
  void scan_past_events(Time now) override { set_time(now); }

  Time current_time() const override;
  size_t size() const override;
  bool contains(const std::shared_ptr<ScheduledEvent>&) const override;
  Time next_event_time() override;

  /* Number of callback exceptions caught so far */
  [[nodiscard]] size_t error_count() const { return _error_count; }

  [[nodiscard]] bool is_running() const { return _thread_id.is_valid(); }

  /** Determine whether the current thread is the sampling thread. */
  [[nodiscard]] bool this_thread_is_sched() const;

private:
  void eventmain();
  void handle_exception(const ScheduledEvent&);

  SchedulerOptions _options;
  error_fn _on_error;
  std::atomic<size_t> _error_count;

  mutable std::recursive_mutex _mutex;
  EventQueue _queue;
  Time _current;

  std::mutex _lifecycle_mutex;
  bool _started;
  StopFlag _stop_flag;
  synchronized_optional<std::thread::id> _thread_id;

  std::thread _thread; // prefer as final member, avoid race conditions
};

} // namespace tempo
