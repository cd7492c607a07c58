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

#include <tempo/util/utils.hpp>
#include <tempo/core/Logger.hpp>
#include <tempo/util/Error.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <thread>
#include <typeinfo>

#include <cxxabi.h>
#include <signal.h>

namespace tempo
{

std::vector<std::string> split(std::string_view str, char delim)
{
  std::vector<std::string> items;
  if (str.empty())
    return items;

  size_t start = 0;
  for (size_t pos = str.find(delim); pos != std::string_view::npos;
       pos = str.find(delim, start)) {
    items.emplace_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  items.emplace_back(str.substr(start));
  return items;
}


std::string demangle(const char* name)
{
  int status = -1;
  std::unique_ptr<char, void (*)(void*)> readable{
      abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free};
  return (status == 0 && readable) ? std::string(readable.get())
                                   : std::string(name);
}


std::string describe_current_exception()
{
  std::ostringstream oss;
  try {
    throw;
  } catch (const Error& e) {
    oss << "(" << demangle(typeid(e).name()) << ") " << e.what();
    if (!e.file().empty())
      oss << " [" << e.where() << "]";
  } catch (const std::exception& e) {
    oss << "(" << demangle(typeid(e).name()) << ") " << e.what();
  } catch (...) {
    oss << "(unknown exception)";
  }
  return oss.str();
}


void log_exception(const char* site)
{
  LOG_WARN("exception during " << site << ": " << describe_current_exception());
}


namespace
{
std::atomic<bool> sigint_seen{false};

void on_sigint(int) { sigint_seen = true; }
} // namespace


void wait_for_sigint()
{
  struct sigaction action = {};
  action.sa_handler = on_sigint;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);

  // the signal may land on any thread, so poll rather than suspend
  while (!sigint_seen)
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
}


std::ostream& operator<<(std::ostream& os, RunMode m) { return os << to_string(m); }


std::string to_string(RunMode m)
{
  switch (m) {
    case RunMode::paper:
      return "paper";
    case RunMode::live:
      return "live";
    case RunMode::backtest:
      return "backtest";
  }
  return "unknown";
}


RunMode parse_run_mode(const std::string& s)
{
  for (auto m : {RunMode::paper, RunMode::live, RunMode::backtest})
    if (to_string(m) == s)
      return m;
  THROW("invalid run_mode '" << s << "', expected paper, live or backtest");
}

} // namespace tempo
