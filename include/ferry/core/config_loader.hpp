// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <ferry/core/logger.hpp>
#include <ferry/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace ferry
{
namespace core
{
/// \brief Loads and parses TOML configuration files.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file cannot be read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Wraps an already-parsed table (used for inline configuration).
  explicit ConfigLoader(parsers::toml::table table) : _table(std::move(table)), _loaded(true) {}

  /// \brief Creates a loader from TOML text.
  static ConfigLoader fromString(const std::string &toml)
  {
    return ConfigLoader(parsers::toml::parse(toml));
  }

  /// \brief Reloads the configuration from disk. On failure the previous
  /// table is kept and false is returned.
  bool reload()
  {
    if (_filename.empty())
    {
      return _loaded;
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      return true;
    }
    catch (const std::exception &e)
    {
      _lastError = e.what();
      FERRY_LOG_WARN("ConfigLoader: failed to load " << _filename << ": " << e.what());
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                               _lastError + ")");
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  const std::string &filename() const { return _filename; }

  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief True when the key exists with a value of any type.
  bool has(const std::string &key) const
  {
    auto node = _table.at_path(key);
    return node && node.is_value();
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  bool _loaded{false};
  std::string _lastError;
};

} // namespace core
} // namespace ferry
