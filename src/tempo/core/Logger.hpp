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
#include <tempo/util/utils.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <string>


namespace tempo
{
class Config;

/* Process-wide line logger writing to stdout.  Each line carries a
 * timestamp, which comes from the installed clock source when there is one
 * (marked with '~') and from the wall clock otherwise. */
class Logger
{
public:
  enum level {
    debug = 1,
    info = 1 << 2,
    note = 1 << 3,
    warn = 1 << 4,
    error = 1 << 5
  };

  static Logger& instance();

  /* Apply the "level" and "detailed" fields of a logging config */
  static void configure_from_config(const Config&);

  static level string_to_level(const std::string&);

  bool wants_level(level l) const { return (l & _mask.load()) != 0; }

  /* Enable `l` and every more severe level */
  void set_level(level l);

  /* Detailed lines also show the thread label and source location */
  void set_detail(bool want_detail) { _detailed = want_detail; }

  void set_is_configured(bool b = true) { _is_configured = b; }
  bool is_configured() const { return _is_configured; }

  void set_clock_source(std::function<Time()>);

  /* Name the calling thread in detailed log lines */
  void register_thread_id(const std::string& label);

  void write(level, const std::string& msg, const char* file, int line);

  void log_banner(RunMode);

private:
  Logger();
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  static long os_thread_id();

  std::string thread_label(long tid);

  std::atomic<int> _mask;
  std::atomic<bool> _detailed{false};
  std::atomic<bool> _is_configured{true};
  bool _banner_done = false;

  std::mutex _write_mutex;

  std::mutex _thread_ids_mutex;
  std::map<long, std::string> _thread_ids;

  std::mutex _clock_mutex;
  std::function<Time()> _clock_fn;
};


#define _TEMPO_LOGIMPL_(msg, LEVEL)                                            \
  do {                                                                         \
    tempo::Logger& _logger = tempo::Logger::instance();                        \
    if (_logger.wants_level(LEVEL)) {                                          \
      std::ostringstream _oss;                                                 \
      _oss << msg;                                                             \
      _logger.write(LEVEL, _oss.str(), __FILE__, __LINE__);                    \
    }                                                                          \
  } while (0)

#define LOG_DEBUG(X) _TEMPO_LOGIMPL_(X, tempo::Logger::level::debug)
#define LOG_INFO(X) _TEMPO_LOGIMPL_(X, tempo::Logger::level::info)
#define LOG_NOTICE(X) _TEMPO_LOGIMPL_(X, tempo::Logger::level::note)
#define LOG_WARN(X) _TEMPO_LOGIMPL_(X, tempo::Logger::level::warn)
#define LOG_ERROR(X) _TEMPO_LOGIMPL_(X, tempo::Logger::level::error)

#ifndef QUOTE
#define QUOTE(X) "'" << X << "'"
#endif

} // namespace tempo
