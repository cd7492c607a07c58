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

#include <cstdlib>
#include <regex>

namespace tempo
{

namespace
{

/* Replace each ${NAME} with the value of environment variable NAME, or with
 * nothing when NAME is unset */
std::string interpolate_env(const std::string& s)
{
  static const std::regex var_re("\\$\\{([a-zA-Z0-9_]*)\\}");

  std::string out;
  auto tail = s.cbegin();
  for (std::sregex_iterator it(s.cbegin(), s.cend(), var_re), end; it != end;
       ++it) {
    out.append(tail, (*it)[0].first);
    if (const char* value = ::getenv((*it)[1].str().c_str()))
      out += value;
    tail = (*it)[0].second;
  }
  out.append(tail, s.cend());
  return out;
}


std::string quoted(const std::string& s) { return "'" + s + "'"; }


[[noreturn]] void throw_wrong_type(const std::string& where,
                                   const char* expected, const json& actual)
{
  std::ostringstream oss;
  oss << "config value " << QUOTE(where) << " is not of type " << expected
      << ", actual " << json_describe_type(actual);
  throw ConfigError(oss.str());
}


template <typename T>
T typed_value(const json& value, bool (json::*is_type)() const noexcept,
              const char* expected, const std::string& where)
{
  if (!(value.*is_type)())
    throw_wrong_type(where, expected, value);
  return value.get<T>();
}

} // namespace


Config Config::empty_config() { return Config(json::object()); }


std::string Config::describe(const std::string& name) const
{
  return _path.empty() ? name : _path + "." + name;
}


const json& Config::field(const std::string& name) const
{
  if (!_raw.is_object())
    throw ConfigError("config " + quoted(_path) +
                      " is not a json object, cannot get field " +
                      quoted(name));

  auto iter = _raw.find(name);
  if (iter == _raw.end()) {
    std::ostringstream oss;
    oss << "field not found, " << QUOTE(name);
    if (!_path.empty())
      oss << " in " << QUOTE(_path);
    throw MissingFieldConfigError(oss.str());
  }
  return *iter;
}


const json& Config::item(size_t i) const
{
  if (!_raw.is_array())
    throw ConfigError("config " + quoted(_path) + " is not a json array");
  if (i >= _raw.size()) {
    std::ostringstream oss;
    oss << "array index " << i << " out of range for " << QUOTE(_path)
        << ", size " << _raw.size();
    throw ConfigError(oss.str());
  }
  return _raw[i];
}


bool Config::has_field(const std::string& name) const
{
  return _raw.is_object() && _raw.contains(name);
}


std::vector<std::string> Config::field_names() const
{
  std::vector<std::string> names;
  if (_raw.is_object())
    for (auto& entry : _raw.items())
      names.push_back(entry.key());
  return names;
}


bool Config::get_bool(const std::string& name) const
{
  return typed_value<json::boolean_t>(field(name), &json::is_boolean,
                                      "boolean", describe(name));
}


bool Config::get_bool(const std::string& name, bool default_value) const
{
  return has_field(name) ? get_bool(name) : default_value;
}


std::string Config::get_string(const std::string& name) const
{
  return interpolate_env(typed_value<json::string_t>(
      field(name), &json::is_string, "string", describe(name)));
}


std::string Config::get_string(const std::string& name,
                               const std::string& default_value) const
{
  return has_field(name) ? get_string(name) : default_value;
}


uint64_t Config::get_uint(const std::string& name) const
{
  return typed_value<json::number_unsigned_t>(
      field(name), &json::is_number_unsigned, "unsigned-number",
      describe(name));
}


uint64_t Config::get_uint(const std::string& name,
                          uint64_t default_value) const
{
  return has_field(name) ? get_uint(name) : default_value;
}


int64_t Config::get_int(const std::string& name) const
{
  return typed_value<json::number_integer_t>(
      field(name), &json::is_number_integer, "integer", describe(name));
}


int64_t Config::get_int(const std::string& name, int64_t default_value) const
{
  return has_field(name) ? get_int(name) : default_value;
}


Config Config::get_sub_config(const std::string& name) const
{
  auto& value = field(name);
  if (!value.is_object() && !value.is_array())
    throw_wrong_type(describe(name), "json-object or json-array", value);
  return Config(value, describe(name));
}


Config Config::get_sub_config(const std::string& name,
                              const Config& default_value) const
{
  return has_field(name) ? get_sub_config(name) : default_value;
}


size_t Config::array_size() const
{
  if (!_raw.is_array())
    throw ConfigError("config " + quoted(_path) + " is not a json array");
  return _raw.size();
}


Config Config::array_item(size_t i) const
{
  return Config(item(i), describe(std::to_string(i)));
}


std::string Config::get_string(size_t i) const
{
  auto where = describe(std::to_string(i));
  return interpolate_env(
      typed_value<json::string_t>(item(i), &json::is_string, "string", where));
}


int64_t Config::get_int(size_t i) const
{
  auto where = describe(std::to_string(i));
  return typed_value<json::number_integer_t>(item(i), &json::is_number_integer,
                                             "integer", where);
}

} // namespace tempo
