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

#include <sstream>
#include <stdexcept>
#include <string>

/* Raise a tempo::Error carrying a stream-formatted message and the throw
 * site */
#define THROW(args)                                                            \
  do {                                                                         \
    std::ostringstream _oss;                                                   \
    _oss << args;                                                              \
    throw tempo::Error(__FILE__, __LINE__, _oss.str());                        \
  } while (0)


namespace tempo
{

class Error : public std::runtime_error
{
public:
  Error(const char* source_file, int source_line, const std::string& msg)
    : std::runtime_error(msg),
      _file(basename_of(source_file)),
      _line(source_line)
  {
  }

  const std::string& file() const noexcept { return _file; }
  int line() const noexcept { return _line; }

  /* Throw site, as "file:line" */
  std::string where() const { return _file + ":" + std::to_string(_line); }

private:
  static std::string basename_of(const char* path)
  {
    std::string s(path ? path : "");
    auto pos = s.rfind('/');
    return pos == std::string::npos ? s : s.substr(pos + 1);
  }

  std::string _file;
  int _line;
};

} // namespace tempo
