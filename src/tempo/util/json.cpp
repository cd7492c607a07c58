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

#include <tempo/util/json.hpp>
#include <tempo/util/Error.hpp>

#include <fstream>

namespace tempo
{

json read_json_config_file(const std::string& path)
{
  std::ifstream ifs(path);
  if (!ifs.is_open())
    THROW("failed to open config file '" << path << "'");

  try {
    return json::parse(ifs, /* callback */ nullptr,
                       /* allow exceptions */ true,
                       /* ignore_comments */ true);
  } catch (const json::parse_error& e) {
    THROW("invalid json in config file '" << path << "': " << e.what());
  }
}


std::string json_describe_type(const json& j)
{
  std::ostringstream oss;
  oss << "(" << j.type_name() << ")";
  if (j.is_number_unsigned())
    oss << "(unsigned)";
  else if (j.is_number_integer())
    oss << "(integer)";
  return oss.str();
}

} // namespace tempo
