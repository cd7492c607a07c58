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

#include <tempo/sched/EventQueue.hpp>
#include <tempo/util/Error.hpp>
#include <tempo/util/utils.hpp>

#include <algorithm>

namespace tempo
{

EventQueue::EventQueue(exception_fn on_exception)
  : _on_exception(std::move(on_exception)),
    _next_seq(0),
    _sort_required(false),
    _purge_required(false),
    _scanning(false)
{
}


bool EventQueue::is_live(const Entry& entry) const
{
  auto iter = _members.find(entry.event.get());
  return iter != _members.end() && iter->second == entry.seq;
}


bool EventQueue::add(std::shared_ptr<ScheduledEvent> event)
{
  if (!event)
    THROW("cannot add null scheduled event");

  const ScheduledEvent* ptr = event.get();
  if (_members.count(ptr))
    return false;

  Entry entry{std::move(event), _next_seq++, ptr->next_event_time()};
  _members.insert({ptr, entry.seq});

  if (_scanning) {
    _pending.push_back(std::move(entry));
  } else {
    _entries.push_back(std::move(entry));
    _sort_required = true;
  }
  return true;
}


bool EventQueue::remove(const ScheduledEvent* event)
{
  // tombstone only; the entry is discarded when next encountered
  if (_members.erase(event) == 0)
    return false;
  _purge_required = true;
  return true;
}


size_t EventQueue::remove(const std::string& name)
{
  size_t count = 0;
  for (auto iter = _members.begin(); iter != _members.end();) {
    if (iter->first->name() == name) {
      iter = _members.erase(iter);
      ++count;
    } else
      ++iter;
  }
  if (count)
    _purge_required = true;
  return count;
}


void EventQueue::clear()
{
  _members.clear();
  _pending.clear();
  if (_scanning)
    _purge_required = true;
  else {
    _entries.clear();
    _sort_required = false;
    _purge_required = false;
  }
}


bool EventQueue::contains(const ScheduledEvent* event) const
{
  return _members.count(event) != 0;
}


/* Bring the ordered view up to date: absorb additions left over from an
 * earlier interrupted scan, discard removed entries, and sort if membership
 * has changed since the last sort. */
void EventQueue::prepare()
{
  if (!_pending.empty()) {
    for (auto& entry : _pending)
      _entries.push_back(std::move(entry));
    _pending.clear();
    _sort_required = true;
  }

  if (_purge_required) {
    _entries.erase(std::remove_if(_entries.begin(), _entries.end(),
                                  [this](const Entry& e) { return !is_live(e); }),
                   _entries.end());
    _purge_required = false;
  }

  if (_sort_required) {
    for (auto& entry : _entries)
      entry.key = entry.event->next_event_time();
    std::sort(_entries.begin(), _entries.end(), entry_less);
    _sort_required = false;
  }
}


void EventQueue::merge_pending()
{
  for (auto& entry : _pending) {
    auto pos = std::upper_bound(_entries.begin(), _entries.end(), entry,
                                entry_less);
    _entries.insert(pos, std::move(entry));
  }
  _pending.clear();
}


/* Restore ordering after the head entry has fired, by moving it to its new
 * position within the already sorted remainder. */
void EventQueue::reposition_head()
{
  if (_entries.empty())
    return;

  if (!is_live(_entries.front())) {
    _entries.pop_front();
    return;
  }

  _entries.front().key = _entries.front().event->next_event_time();
  auto pos = std::upper_bound(_entries.begin() + 1, _entries.end(),
                              _entries.front(), entry_less);
  std::rotate(_entries.begin(), _entries.begin() + 1, pos);
}


Time EventQueue::next_event_time()
{
  Time earliest = Time::end_of_time();

  if (_scanning) {
    // ordering must not be disturbed mid-scan, so search linearly
    for (auto& entry : _entries)
      if (is_live(entry) && entry.key < earliest)
        earliest = entry.key;
    for (auto& entry : _pending)
      if (entry.key < earliest)
        earliest = entry.key;
    return earliest;
  }

  prepare();
  for (auto& entry : _entries)
    if (is_live(entry))
      return entry.key;
  return earliest;
}


size_t EventQueue::fire_until(Time now)
{
  if (_scanning)
    THROW("scheduled events cannot be scanned from within an event callback");

  prepare();

  _scanning = true;
  scope_guard end_of_scan([this]() { _scanning = false; });

  size_t fired = 0;
  while (true) {
    merge_pending();

    while (!_entries.empty() && !is_live(_entries.front()))
      _entries.pop_front();

    if (_entries.empty())
      break;

    Time due = _entries.front().key;
    if (due.is_end_of_time() || due > now)
      break;

    // hold a reference, the callback may remove this event
    std::shared_ptr<ScheduledEvent> event = _entries.front().event;

    try {
      event->scan(due, fired);
    } catch (...) {
      reposition_head();
      if (!_on_exception)
        throw;
      _on_exception(*event);
      continue;
    }

    reposition_head();
  }

  return fired;
}

} // namespace tempo
