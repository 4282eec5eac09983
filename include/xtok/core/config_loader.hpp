// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "xtok/core/logger.hpp"
#include "xtok/parsers/minimal_toml.hpp"
#include "xtok/parsers/reader.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace xtok
{
namespace core
{
/// \brief Loads reader and logging settings from a TOML file.
///
/// Recognized keys:
///   [reader] trim_text, trim_text_end, expand_empty_elements, chunk_size
///   [log]    level, file, format
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file cannot be read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Build from TOML text instead of a file.
  static ConfigLoader fromString(const std::string &text)
  {
    ConfigLoader loader;
    loader._table = parsers::toml::parse(text);
    loader._loaded = true;
    return loader;
  }

  /// \brief Reloads the configuration from disk. On failure the previous
  /// values are kept and false is returned.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      return true;
    }
    catch (const std::runtime_error &e)
    {
      XTOK_LOG_WARN("Failed to reload configuration " << _filename << ": " << e.what());
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    if (!_loaded)
    {
      try
      {
        _table = parsers::toml::parse_file(_filename);
      }
      catch (const std::runtime_error &e)
      {
        throw std::runtime_error("Failed to load configuration file " + _filename + ": " +
                                 e.what());
      }
      _loaded = true;
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  const parsers::toml::table &table() const { return _table; }

  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    return _table.get<T>(dottedKey);
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Reader options from the [reader] table over `base`.
  /// \throws std::runtime_error for a present key of the wrong type or a
  /// non-positive chunk size.
  parsers::ReaderConfig readerConfig(parsers::ReaderConfig base = parsers::ReaderConfig{}) const
  {
    // trim_text covers both ends; the _start and _end keys refine it
    if (_table.contains("reader.trim_text"))
    {
      bool both = requireBool("reader.trim_text", false);
      base.trimTextStart = both;
      base.trimTextEnd = both;
    }
    base.trimTextStart = requireBool("reader.trim_text_start", base.trimTextStart);
    base.trimTextEnd = requireBool("reader.trim_text_end", base.trimTextEnd);
    base.expandEmptyElements = requireBool("reader.expand_empty_elements",
                                           base.expandEmptyElements);
    if (_table.contains("reader.chunk_size"))
    {
      auto size = getInt("reader.chunk_size");
      if (!size || *size <= 0)
      {
        throw std::runtime_error("reader.chunk_size must be a positive integer");
      }
      base.chunkSize = static_cast<std::size_t>(*size);
    }
    return base;
  }

  /// \brief Apply the [log] table to the global Logger.
  /// \throws std::runtime_error for an unknown level name or a value of the
  /// wrong type. An unwritable log file falls back to std::cerr.
  void applyLogging() const
  {
    Logger::Level level = Logger::getLevel();
    if (auto name = requireString("log.level"))
    {
      auto parsed = Logger::parseLevel(*name);
      if (!parsed)
      {
        throw std::runtime_error("log.level: unknown level '" + *name + "'");
      }
      level = *parsed;
    }
    if (auto file = requireString("log.file"))
    {
      Logger::init(level, *file);
    }
    else
    {
      Logger::setLevel(level);
    }
    if (auto format = requireString("log.format"))
    {
      Logger::setLogFormat(*format);
    }
  }

private:
  ConfigLoader() = default;

  bool requireBool(const std::string &key, bool fallback) const
  {
    if (!_table.contains(key))
    {
      return fallback;
    }
    auto v = getBool(key);
    if (!v)
    {
      throw std::runtime_error(key + " must be a boolean");
    }
    return *v;
  }

  std::optional<std::string> requireString(const std::string &key) const
  {
    if (!_table.contains(key))
    {
      return std::nullopt;
    }
    auto v = getString(key);
    if (!v)
    {
      throw std::runtime_error(key + " must be a string");
    }
    return v;
  }

  std::string _filename;
  parsers::toml::table _table;
  bool _loaded{false};
};

} // namespace core
} // namespace xtok
