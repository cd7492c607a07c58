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

#include <tempo/sched/LiveEventScheduler.hpp>
#include <tempo/core/Logger.hpp>
#include <tempo/util/Error.hpp>

namespace tempo
{

LiveEventScheduler::LiveEventScheduler(SchedulerOptions options,
                                       error_fn on_error)
  : _options(std::move(options)),
    _on_error(std::move(on_error)),
    _error_count(0),
    _queue([this](const ScheduledEvent& event) { handle_exception(event); }),
    _started(false)
{
  if (_options.interval.count() <= 0)
    THROW("live scheduler interval must be positive");
  if (!_options.clock)
    _options.clock = &Time::realtime_now;
}


LiveEventScheduler::~LiveEventScheduler() { sync_stop(); }


void LiveEventScheduler::start()
{
  std::lock_guard<std::mutex> guard(_lifecycle_mutex);
  if (_started)
    THROW("live scheduler already started");
  _started = true;
  _thread = std::thread(&LiveEventScheduler::eventmain, this);
}


void LiveEventScheduler::sync_stop()
{
  _stop_flag.request_stop();

  // a callback stopping its own scheduler cannot join; the thread exits once
  // the current tick completes
  if (this_thread_is_sched())
    return;

  std::lock_guard<std::mutex> guard(_lifecycle_mutex);
  if (_thread.joinable())
    _thread.join();
}


bool LiveEventScheduler::this_thread_is_sched() const
{
  return _thread_id.compare(std::this_thread::get_id());
}


/* Thread entry point */
void LiveEventScheduler::eventmain()
{
  scope_guard undo_thread_id([this]() { _thread_id.release(); });
  _thread_id.set_value(std::this_thread::get_id());

  Logger::instance().register_thread_id("sched");
  LOG_INFO("live scheduler started, interval " << _options.interval.count()
           << "ms");

  while (!_stop_flag.is_requested()) {
    try {
      set_time(_options.clock());
    } catch (...) {
      ++_error_count;
      log_exception("live scheduler tick");
    }

    if (_stop_flag.wait_for_requested(_options.interval))
      break;
  }

  LOG_INFO("live scheduler stopped");
}


void LiveEventScheduler::handle_exception(const ScheduledEvent& event)
{
  ++_error_count;
  std::string what = describe_current_exception();
  LOG_ERROR("exception in scheduled event " << QUOTE(event.name()) << ": "
            << what);

  if (_on_error)
    try {
      _on_error(event, what);
    } catch (...) {
      log_exception("scheduler error handler");
    }
}


void LiveEventScheduler::add(std::shared_ptr<ScheduledEvent> event)
{
  if (!event)
    THROW("cannot add null scheduled event");

  std::lock_guard<std::recursive_mutex> guard(_mutex);

  if (_queue.contains(event.get())) {
    LOG_WARN("scheduled event " << QUOTE(event->name())
             << " already added, ignoring");
    return;
  }

  if (_options.log_events)
    event->set_logging_enabled(true);

  if (_options.skip_past_events && !_current.empty())
    event->skip_until(_current);

  _queue.add(std::move(event));
}


void LiveEventScheduler::remove(const std::shared_ptr<ScheduledEvent>& event)
{
  std::lock_guard<std::recursive_mutex> guard(_mutex);
  _queue.remove(event.get());
}


void LiveEventScheduler::remove(const std::string& name)
{
  std::lock_guard<std::recursive_mutex> guard(_mutex);
  _queue.remove(name);
}


void LiveEventScheduler::set_time(Time now)
{
  std::lock_guard<std::recursive_mutex> guard(_mutex);

  if (!_current.empty() && now < _current) {
    LOG_WARN("ignoring scheduler time moving backwards, from now: "
             << _current << ", to: " << now);
    return;
  }

  // checked before the clock moves, so a rejected call leaves it untouched
  if (_queue.is_scanning())
    THROW("scheduler time cannot be set from within an event callback");

  _current = now;
  _queue.fire_until(now);
}


Time LiveEventScheduler::current_time() const
{
  std::lock_guard<std::recursive_mutex> guard(_mutex);
  return _current;
}


size_t LiveEventScheduler::size() const
{
  std::lock_guard<std::recursive_mutex> guard(_mutex);
  return _queue.size();
}


bool LiveEventScheduler::contains(
    const std::shared_ptr<ScheduledEvent>& event) const
{
  std::lock_guard<std::recursive_mutex> guard(_mutex);
  return _queue.contains(event.get());
}


Time LiveEventScheduler::next_event_time()
{
  std::lock_guard<std::recursive_mutex> guard(_mutex);
  return _queue.next_event_time();
}

} // namespace tempo
