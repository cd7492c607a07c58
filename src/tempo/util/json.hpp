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

// nlohmann json without implicit conversions; values are read with get<T>()
#define JSON_USE_IMPLICIT_CONVERSIONS 0
#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

namespace tempo
{

/* Describe the type of a json value, eg "(number)(integer)" */
std::string json_describe_type(const json&);

/* Read and parse a json config file; comments are permitted. Throws
 * tempo::Error when the file cannot be opened or parsed. */
json read_json_config_file(const std::string& path);

} // namespace tempo
