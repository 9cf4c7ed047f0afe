// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <edgeguard/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace edgeguard
{
namespace core
{

/// \brief Raised when configuration cannot be loaded or is unusable.
class ConfigError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// \brief Loads and parses TOML configuration files for the application.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws ConfigError if the file is missing or malformed
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Builds a loader over in-memory TOML text (no backing file).
  static ConfigLoader fromString(const std::string &text)
  {
    ConfigLoader loader;
    try
    {
      loader._table = parsers::toml::parse(text);
    }
    catch (const std::exception &e)
    {
      throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
    return loader;
  }

  const parsers::toml::table &load()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
    }
    catch (const std::exception &e)
    {
      throw ConfigError("Failed to load configuration file: " + _filename + " (" + e.what() +
                        ")");
    }
    return _table;
  }

  const std::string &filename() const { return _filename; }

  /// \brief Gets the full configuration table.
  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T std::int64_t, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<std::int64_t> getInt(const std::string &key) const
  {
    return get<std::int64_t>(key);
  }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings from the configuration.
  /// \return std::nullopt if the key is missing or not an array
  /// \throws ConfigError if any element is not a string
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node || !node.is_array())
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *node.as_array())
    {
      if (auto *strVal = std::get_if<std::string>(&elem))
      {
        result.push_back(*strVal);
      }
      else
      {
        throw ConfigError("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

private:
  ConfigLoader() = default;

  std::string _filename;
  parsers::toml::table _table;
};

} // namespace core
} // namespace edgeguard
