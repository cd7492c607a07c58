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

#include <cctype>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>


namespace tempo
{

/* How the process is driven: against the wall clock (paper, live) or by a
 * simulation clock (backtest) */
enum class RunMode { paper = 1, live = 2, backtest = 3 };

std::string to_string(RunMode);
std::ostream& operator<<(std::ostream&, RunMode);
RunMode parse_run_mode(const std::string& s);
inline bool is_realtime(RunMode m) { return m != RunMode::backtest; }

/* Split on a single delimiter; an empty input yields no items */
std::vector<std::string> split(std::string_view str, char delim);

/* Copy of str without leading and trailing whitespace */
inline std::string trim(std::string_view str)
{
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1])))
    --end;
  return std::string(str.substr(begin, end - begin));
}


/* A value that may be unset, guarded by a mutex so that one thread can set or
 * clear it while others test it. */
template <typename T> class synchronized_optional
{
public:
  void set_value(T value)
  {
    std::lock_guard<std::mutex> guard(_mutex);
    _value = std::move(value);
    _valid = true;
  }

  void release()
  {
    std::lock_guard<std::mutex> guard(_mutex);
    _valid = false;
  }

  bool compare(const T& value) const
  {
    std::lock_guard<std::mutex> guard(_mutex);
    return _valid && _value == value;
  }

  bool is_valid() const
  {
    std::lock_guard<std::mutex> guard(_mutex);
    return _valid;
  }

private:
  mutable std::mutex _mutex;
  bool _valid = false;
  T _value{};
};


/* Runs an action when the enclosing scope exits, however it exits */
class scope_guard
{
public:
  template <class Callable>
  explicit scope_guard(Callable&& on_exit)
    : _on_exit(std::forward<Callable>(on_exit))
  {
  }

  ~scope_guard()
  {
    if (_on_exit)
      _on_exit();
  }

  scope_guard(const scope_guard&) = delete;
  scope_guard& operator=(const scope_guard&) = delete;

private:
  std::function<void()> _on_exit;
};

std::string demangle(const char* name);

/* Describe the in-flight exception as "(type) what", with the throw site when
 * it is a tempo::Error. Only valid inside a catch block. */
std::string describe_current_exception();

/* Log the in-flight exception at warning level */
void log_exception(const char* site);

/* Block the calling thread until SIGINT arrives */
void wait_for_sigint();

} // namespace tempo
