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

#include <tempo/sched/ScheduledEvent.hpp>
#include <tempo/util/Time.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tempo
{

/* Collection of scheduled events, ordered by (next event time, insertion
 * sequence), which fires due events in global time order.
 *
 * Ordering is maintained lazily.  A full sort happens only on the first scan
 * after membership has changed; between firings of a single scan only the
 * fired event is moved, to its new position.  Events added or removed from
 * within a callback are deferred: a removed event never fires again, and an
 * added event is merged into the ordering after the current firing.
 *
 * Not thread safe; callers provide any locking. */
class EventQueue
{
public:
  /* Invoked from within a catch block when an event callback throws. If no
   * handler is installed, the exception propagates out of fire_until. */
  typedef std::function<void(const ScheduledEvent&)> exception_fn;

  explicit EventQueue(exception_fn on_exception = {});

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  /* Add an event. Returns false, without change, if that same event object is
   * already present. */
  bool add(std::shared_ptr<ScheduledEvent>);

  /* Remove an event. Returns false if the event was not present. */
  bool remove(const ScheduledEvent*);

  /* Remove all events having the given name; returns the number removed */
  size_t remove(const std::string& name);

  void clear();

  [[nodiscard]] bool contains(const ScheduledEvent*) const;

  [[nodiscard]] size_t size() const { return _members.size(); }

  [[nodiscard]] bool empty() const { return _members.empty(); }

  /* Earliest pending time across all events, or end_of_time if none */
  Time next_event_time();

  /* Fire, in ascending (time, insertion) order, every event time at or before
   * `now`.  Returns the number of callbacks invoked. Must not be called from
   * within a callback. */
  size_t fire_until(Time now);

  /* True while fire_until is invoking callbacks */
  [[nodiscard]] bool is_scanning() const { return _scanning; }

private:
  struct Entry
  {
    std::shared_ptr<ScheduledEvent> event;
    uint64_t seq;
    Time key;
  };

  static bool entry_less(const Entry& a, const Entry& b)
  {
    return a.key < b.key || (a.key == b.key && a.seq < b.seq);
  }

  [[nodiscard]] bool is_live(const Entry&) const;
  void prepare();
  void merge_pending();
  void reposition_head();

  exception_fn _on_exception;
  std::deque<Entry> _entries;
  std::vector<Entry> _pending;
  std::unordered_map<const ScheduledEvent*, uint64_t> _members;
  uint64_t _next_seq;
  bool _sort_required;
  bool _purge_required;
  bool _scanning;
};

} // namespace tempo
