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

#include <tempo/util/Time.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace tempo
{

/* Forward-only cursor over an ascending series of UTC times.  The series may
 * be finite or unbounded; values are produced only when asked for.
 *
 * Implementations must yield times in non-decreasing order; this is not
 * checked. */
class TimeSequence
{
public:
  virtual ~TimeSequence() = default;

  /* Return the next time of the series, or Time::end_of_time() once the series
   * is exhausted. After exhaustion every further call returns end_of_time. */
  virtual Time next() = 0;
};


/* Series backed by an explicit list of times. */
class ListTimeSequence : public TimeSequence
{
public:
  explicit ListTimeSequence(std::vector<Time> times)
    : _times(std::move(times)), _pos(0)
  {
  }

  Time next() override;

private:
  std::vector<Time> _times;
  size_t _pos;
};


/* Series produced by a generator function.  The generator returns
 * Time::end_of_time() to signal completion, after which it is not called
 * again. */
class GeneratorTimeSequence : public TimeSequence
{
public:
  typedef std::function<Time()> generator_fn;

  explicit GeneratorTimeSequence(generator_fn fn)
    : _fn(std::move(fn)), _done(false)
  {
  }

  Time next() override;

private:
  generator_fn _fn;
  bool _done;
};


/* Series containing the items of an underlying series that satisfy a
 * predicate. */
class FilterTimeSequence : public TimeSequence
{
public:
  typedef std::function<bool(Time)> predicate_fn;

  FilterTimeSequence(std::unique_ptr<TimeSequence> source, predicate_fn pred)
    : _source(std::move(source)), _pred(std::move(pred))
  {
  }

  Time next() override;

private:
  std::unique_ptr<TimeSequence> _source;
  predicate_fn _pred;
};


/* Series obtained by expanding each item of an underlying series (typically a
 * series of dates) into zero or more times.  Each expansion must be ascending,
 * and must not precede the previous expansion. */
class ExpandingTimeSequence : public TimeSequence
{
public:
  typedef std::function<std::vector<Time>(Time)> expand_fn;

  ExpandingTimeSequence(std::unique_ptr<TimeSequence> source, expand_fn fn)
    : _source(std::move(source)), _fn(std::move(fn)), _pos(0)
  {
  }

  Time next() override;

private:
  std::unique_ptr<TimeSequence> _source;
  expand_fn _fn;
  std::vector<Time> _buffer;
  size_t _pos;
};


std::unique_ptr<TimeSequence> make_time_sequence(std::vector<Time> times);

std::unique_ptr<TimeSequence> make_generator(GeneratorTimeSequence::generator_fn);

std::unique_ptr<TimeSequence> filter(std::unique_ptr<TimeSequence>,
                                     FilterTimeSequence::predicate_fn);

std::unique_ptr<TimeSequence> expand(std::unique_ptr<TimeSequence>,
                                     ExpandingTimeSequence::expand_fn);

/* Drain a series into a vector, stopping after `limit` items. */
std::vector<Time> take(TimeSequence& seq, size_t limit);

} // namespace tempo
