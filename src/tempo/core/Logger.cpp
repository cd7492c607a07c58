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

#include <tempo/core/Logger.hpp>
#include <tempo/util/Config.hpp>

#include <iomanip>
#include <iostream>
#include <utility>

#include <sys/syscall.h>
#include <unistd.h>

namespace tempo
{

namespace
{

const size_t thread_column_width = 18;

const std::pair<const char*, Logger::level> level_names[] = {
    {"debug", Logger::level::debug},
    {"info", Logger::level::info},
    {"note", Logger::level::note},
    {"warn", Logger::level::warn},
    {"error", Logger::level::error}};


const char* level_column(Logger::level l)
{
  switch (l) {
    case Logger::level::error:
      return "| ERROR | ";
    case Logger::level::warn:
      return "| WARN  | ";
    case Logger::level::note:
      return "| NOTE  | ";
    case Logger::level::info:
      return "| INFO  | ";
    case Logger::level::debug:
      return "| DEBUG | ";
  }
  return "| ????  | ";
}


/* Fixed width "| tid/name" column */
std::string thread_column(long tid, const std::string& name)
{
  std::string label = "| " + std::to_string(tid) + "/" + name;
  label.resize(thread_column_width, ' ');
  label.back() = ' ';
  return label;
}


const char* banner_art = R"(
  _
 | |_ ___ _ __ ___  _ __   ___
 | __/ _ \ '_ ` _ \| '_ \ / _ \
 | ||  __/ | | | | | |_) | (_) |
  \__\___|_| |_| |_| .__/ \___/
                   |_|
)";

} // namespace


Logger& Logger::instance()
{
  static Logger logger;
  return logger;
}


Logger::Logger() { set_level(level::info); }


/* Kernel thread id, as reported by top and ps */
long Logger::os_thread_id() { return ::syscall(SYS_gettid); }


void Logger::set_level(level l)
{
  int mask = 0;
  for (auto& entry : level_names)
    if (entry.second >= l)
      mask |= entry.second;
  _mask = mask;
}


Logger::level Logger::string_to_level(const std::string& s)
{
  for (auto& entry : level_names)
    if (s == entry.first)
      return entry.second;
  throw ConfigError("log level not recognised: '" + s +
                    "', expected debug, info, note, warn or error");
}


void Logger::configure_from_config(const Config& config)
{
  auto& logger = instance();
  logger.set_level(string_to_level(config.get_string("level", "info")));
  logger.set_detail(config.get_bool("detailed", false));
  logger.set_is_configured(true);
}


void Logger::set_clock_source(std::function<Time()> fn)
{
  std::lock_guard<std::mutex> guard(_clock_mutex);
  _clock_fn = std::move(fn);
}


void Logger::register_thread_id(const std::string& label)
{
  auto tid = os_thread_id();
  std::lock_guard<std::mutex> guard(_thread_ids_mutex);
  _thread_ids[tid] = thread_column(tid, label);
}


std::string Logger::thread_label(long tid)
{
  std::lock_guard<std::mutex> guard(_thread_ids_mutex);
  auto iter = _thread_ids.find(tid);
  if (iter == _thread_ids.end())
    iter = _thread_ids.emplace(tid, thread_column(tid, "????")).first;
  return iter->second;
}


void Logger::write(level lvl, const std::string& msg, const char* file,
                   int line)
{
  // copy the clock out first; a clock that itself logs must not deadlock
  std::function<Time()> clock_fn;
  {
    std::lock_guard<std::mutex> guard(_clock_mutex);
    clock_fn = _clock_fn;
  }
  Time t = clock_fn ? clock_fn() : Time::realtime_now();

  std::ostringstream oss;
  oss << t.strftime("%Y-%m-%d | %H:%M:%S") << "." << std::setw(6)
      << std::setfill('0') << t.usec().count() << std::setfill(' ')
      << (clock_fn ? '~' : ' ');

  bool detailed = _detailed;
  if (detailed)
    oss << thread_label(os_thread_id());
  oss << level_column(lvl) << msg;
  if (detailed) {
    auto parts = split(file, '/');
    oss << " (" << (parts.empty() ? file : parts.back()) << ":" << line << ")";
  }
  oss << "\n";

  std::lock_guard<std::mutex> guard(_write_mutex);
  std::cout << oss.str();
}


void Logger::log_banner(RunMode mode)
{
  std::lock_guard<std::mutex> guard(_write_mutex);
  if (_banner_done)
    return;
  _banner_done = true;

  auto lines = split(banner_art, '\n');
  for (size_t i = 1; i < lines.size(); ++i) {
    std::cout << lines[i];
    if (i == 3)
      std::cout << "   mode: "
                << (mode == RunMode::live ? "LIVE" : to_string(mode));
    std::cout << "\n";
  }
  std::cout.flush();
}

} // namespace tempo
