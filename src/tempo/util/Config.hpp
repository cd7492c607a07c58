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

#include <tempo/util/json.hpp>
#include <tempo/util/Error.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tempo
{

/* Raised for any config value that is absent, of the wrong type or out of
 * range */
class ConfigError : public Error
{
public:
  explicit ConfigError(const std::string& what) : Error("", 0, what) {}
};

class MissingFieldConfigError : public ConfigError
{
public:
  using ConfigError::ConfigError;
};


/* Read-only view over a JSON config document, or over one of its objects or
 * arrays.  Each view remembers its dotted path from the root so that errors
 * can name the offending field.  String values have ${NAME} replaced by the
 * environment variable NAME. */
class Config
{
public:
  explicit Config(json raw = json::object(), std::string path = "")
    : _raw(std::move(raw)), _path(std::move(path))
  {
  }

  static Config empty_config();

  // object access
  bool get_bool(const std::string& field) const;
  bool get_bool(const std::string& field, bool default_value) const;

  std::string get_string(const std::string& field) const;
  std::string get_string(const std::string& field,
                         const std::string& default_value) const;

  uint64_t get_uint(const std::string& field) const;
  uint64_t get_uint(const std::string& field, uint64_t default_value) const;

  int64_t get_int(const std::string& field) const;
  int64_t get_int(const std::string& field, int64_t default_value) const;

  Config get_sub_config(const std::string& field) const;
  Config get_sub_config(const std::string& field,
                        const Config& default_value) const;

  [[nodiscard]] bool has_field(const std::string& field) const;

  /* Field names of a json-object config, in json key order */
  [[nodiscard]] std::vector<std::string> field_names() const;

  // array access
  [[nodiscard]] size_t array_size() const;
  Config array_item(size_t i) const;
  std::string get_string(size_t i) const;
  int64_t get_int(size_t i) const;

private:
  const json& field(const std::string& name) const;
  const json& item(size_t i) const;
  std::string describe(const std::string& name) const;

  json _raw;
  std::string _path;
};

} // namespace tempo
