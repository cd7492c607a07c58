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

#include <tempo/sched/TimeSequence.hpp>

namespace tempo
{

Time ListTimeSequence::next()
{
  if (_pos < _times.size())
    return _times[_pos++];
  else
    return Time::end_of_time();
}


Time GeneratorTimeSequence::next()
{
  if (_done)
    return Time::end_of_time();

  Time t = _fn();
  if (t.is_end_of_time()) {
    _done = true;
    _fn = nullptr; // release captured state
  }
  return t;
}


Time FilterTimeSequence::next()
{
  while (true) {
    Time t = _source->next();
    if (t.is_end_of_time() || _pred(t))
      return t;
  }
}


Time ExpandingTimeSequence::next()
{
  while (_pos >= _buffer.size()) {
    Time item = _source->next();
    if (item.is_end_of_time())
      return item;
    _buffer = _fn(item);
    _pos = 0;
  }
  return _buffer[_pos++];
}


std::unique_ptr<TimeSequence> make_time_sequence(std::vector<Time> times)
{
  return std::make_unique<ListTimeSequence>(std::move(times));
}


std::unique_ptr<TimeSequence> make_generator(
    GeneratorTimeSequence::generator_fn fn)
{
  return std::make_unique<GeneratorTimeSequence>(std::move(fn));
}


std::unique_ptr<TimeSequence> filter(std::unique_ptr<TimeSequence> source,
                                     FilterTimeSequence::predicate_fn pred)
{
  return std::make_unique<FilterTimeSequence>(std::move(source),
                                              std::move(pred));
}


std::unique_ptr<TimeSequence> expand(std::unique_ptr<TimeSequence> source,
                                     ExpandingTimeSequence::expand_fn fn)
{
  return std::make_unique<ExpandingTimeSequence>(std::move(source),
                                                 std::move(fn));
}


std::vector<Time> take(TimeSequence& seq, size_t limit)
{
  std::vector<Time> items;
  while (items.size() < limit) {
    Time t = seq.next();
    if (t.is_end_of_time())
      break;
    items.push_back(t);
  }
  return items;
}

} // namespace tempo
