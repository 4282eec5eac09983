// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace xtok
{
namespace core
{

namespace detail
{
  /// \brief File name part of __FILE__, computed at compile time.
  constexpr const char *sourceBasename(const char *path)
  {
    const char *last = path;
    for (const char *p = path; *p; ++p)
    {
      if (*p == '/' || *p == '\\')
      {
        last = p + 1;
      }
    }
    return last;
  }

  /// \brief One piece of a compiled log line format.
  struct LogField
  {
    enum class Kind
    {
      Text,
      Timestamp,
      Thread,
      Level,
      Message,
      File,
      Line,
      Function
    };
    Kind kind;
    std::string text; ///< Literal text for Kind::Text
  };

  /// \brief Split a format such as "[%T] [%L] %m" into fields. Unknown
  /// placeholders and a trailing '%' are kept as text.
  inline std::vector<LogField> compileLogFormat(std::string_view format)
  {
    std::vector<LogField> fields;
    std::string text;
    auto flushText = [&]()
    {
      if (!text.empty())
      {
        fields.push_back({LogField::Kind::Text, text});
        text.clear();
      }
    };

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 == format.size())
      {
        text.push_back(format[i]);
        continue;
      }
      char spec = format[++i];
      std::optional<LogField::Kind> kind;
      switch (spec)
      {
      case 'T':
        kind = LogField::Kind::Timestamp;
        break;
      case 't':
        kind = LogField::Kind::Thread;
        break;
      case 'L':
        kind = LogField::Kind::Level;
        break;
      case 'm':
        kind = LogField::Kind::Message;
        break;
      case 'F':
        kind = LogField::Kind::File;
        break;
      case 'l':
        kind = LogField::Kind::Line;
        break;
      case 'f':
        kind = LogField::Kind::Function;
        break;
      case '%':
        text.push_back('%');
        break;
      default:
        text.push_back('%');
        text.push_back(spec);
        break;
      }
      if (kind)
      {
        flushText();
        fields.push_back({*kind, {}});
      }
    }
    flushText();
    return fields;
  }
} // namespace detail

/// \brief Process-wide synchronous logger.
///
/// Lines go to std::cerr by default so that tools writing data to stdout are
/// not disturbed. init() can redirect them to a file; an external handler,
/// when registered, receives every line instead of both.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief Receives the level, the formatted line and the bare message.
  /// Called with the logger lock held; it must not log itself.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  /// \brief Set the minimum level and, optionally, a file to append to.
  /// An empty path (or one that cannot be opened) keeps logging on std::cerr.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    Sink &sink = instance();
    std::lock_guard<std::mutex> guard(sink.mutex);
    sink.threshold = level;
    sink.timeFormat = timeFormat;
    sink.file.reset();
    if (filePath.empty())
    {
      return;
    }
    auto file = std::make_unique<std::ofstream>(filePath, std::ios::app);
    if (file->is_open())
    {
      sink.file = std::move(file);
    }
    else
    {
      std::cerr << "[xtok] cannot open log file " << filePath << ", using stderr" << std::endl;
    }
  }

  static void flush()
  {
    Sink &sink = instance();
    std::lock_guard<std::mutex> guard(sink.mutex);
    sink.stream().flush();
  }

  static void setLevel(Level level)
  {
    Sink &sink = instance();
    std::lock_guard<std::mutex> guard(sink.mutex);
    sink.threshold = level;
  }

  static Level getLevel()
  {
    Sink &sink = instance();
    std::lock_guard<std::mutex> guard(sink.mutex);
    return sink.threshold;
  }

  static void setExternalHandler(ExternalHandler handler)
  {
    Sink &sink = instance();
    std::lock_guard<std::mutex> guard(sink.mutex);
    sink.handler = std::move(handler);
  }

  static void clearExternalHandler() { setExternalHandler(nullptr); }

  /// \brief Set the line format. Placeholders:
  ///   %T timestamp (format given to init(), milliseconds appended after %S)
  ///   %t thread id hash, %L level, %m message
  ///   %F source file, %l source line, %f function (XTOK_LOG_* macros only)
  ///   %% literal percent sign
  /// An empty format is ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto fields = detail::compileLogFormat(format);
    Sink &sink = instance();
    std::lock_guard<std::mutex> guard(sink.mutex);
    sink.format = format;
    sink.fields = std::move(fields);
  }

  static std::string getLogFormat()
  {
    Sink &sink = instance();
    std::lock_guard<std::mutex> guard(sink.mutex);
    return sink.format;
  }

  /// \brief Level from a case-insensitive name; "warn" and "warning" are
  /// both accepted.
  static std::optional<Level> parseLevel(std::string_view name)
  {
    static const std::pair<const char *, Level> kNames[] = {
      {"trace", Level::Trace}, {"debug", Level::Debug},     {"info", Level::Info},
      {"warn", Level::Warning}, {"warning", Level::Warning}, {"error", Level::Error},
      {"fatal", Level::Fatal}};
    for (const auto &[text, level] : kNames)
    {
      std::string_view candidate(text);
      if (candidate.size() != name.size())
      {
        continue;
      }
      bool same = true;
      for (std::size_t i = 0; i < name.size() && same; ++i)
      {
        char ch = name[i];
        if (ch >= 'A' && ch <= 'Z')
        {
          ch = static_cast<char>(ch - 'A' + 'a');
        }
        same = ch == candidate[i];
      }
      if (same)
      {
        return level;
      }
    }
    return std::nullopt;
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    }
    return "UNKNOWN";
  }

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Emit one line. `file` is null when no source location is known.
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    Sink &sink = instance();
    std::lock_guard<std::mutex> guard(sink.mutex);
    if (level < sink.threshold)
    {
      return;
    }
    std::string formatted = sink.render(level, message, file, line, function);
    if (sink.handler)
    {
      sink.handler(level, formatted, message);
      return;
    }
    std::ostream &out = sink.stream();
    out << formatted;
    if (sink.file)
    {
      out.flush();
    }
  }

  /// \brief printf-style variant used by the XTOK_LOG_*F macros.
  static void logf(Level level, const char *file, int line, const char *function, const char *fmt,
                   ...)
  {
    va_list args;
    va_start(args, fmt);
    va_list measure;
    va_copy(measure, args);
    int size = std::vsnprintf(nullptr, 0, fmt, measure);
    va_end(measure);
    std::string message;
    if (size < 0)
    {
      message = "invalid log format string";
    }
    else
    {
      message.resize(static_cast<std::size_t>(size) + 1);
      std::vsnprintf(&message[0], message.size(), fmt, args);
      message.resize(static_cast<std::size_t>(size));
    }
    va_end(args);
    log(level, message, file, line, function);
  }

private:
  struct Sink
  {
    std::mutex mutex;
    Level threshold = Level::Info;
    std::string timeFormat = "%Y-%m-%d %H:%M:%S";
    std::string format = "[%T] [%L] %m";
    std::vector<detail::LogField> fields = detail::compileLogFormat("[%T] [%L] %m");
    std::unique_ptr<std::ofstream> file;
    ExternalHandler handler;

    std::ostream &stream() { return file ? static_cast<std::ostream &>(*file) : std::cerr; }

    std::string render(Level level, const std::string &message, const char *srcFile,
                       int srcLine, const char *function) const
    {
      std::ostringstream line;
      for (const auto &field : fields)
      {
        switch (field.kind)
        {
        case detail::LogField::Kind::Text:
          line << field.text;
          break;
        case detail::LogField::Kind::Timestamp:
          appendTimestamp(line);
          break;
        case detail::LogField::Kind::Thread:
          line << std::hex << std::hash<std::thread::id>{}(std::this_thread::get_id())
               << std::dec;
          break;
        case detail::LogField::Kind::Level:
          line << levelToString(level);
          break;
        case detail::LogField::Kind::Message:
          line << message;
          break;
        case detail::LogField::Kind::File:
          if (srcFile)
            line << detail::sourceBasename(srcFile);
          break;
        case detail::LogField::Kind::Line:
          if (srcFile)
            line << srcLine;
          break;
        case detail::LogField::Kind::Function:
          if (function)
            line << function;
          break;
        }
      }
      line << '\n';
      return line.str();
    }

    void appendTimestamp(std::ostringstream &line) const
    {
      auto now = std::chrono::system_clock::now();
      std::time_t seconds = std::chrono::system_clock::to_time_t(now);
      std::tm local{};
      localtime_r(&seconds, &local);
      line << std::put_time(&local, timeFormat.c_str());
      if (timeFormat.find("%S") != std::string::npos)
      {
        auto millis =
          std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
          1000;
        line << '.' << std::setfill('0') << std::setw(3) << millis;
      }
    }
  };

  static Sink &instance()
  {
    static Sink sink;
    return sink;
  }
};

} // namespace core
} // namespace xtok

/// \brief Stream-style logging with source location:
/// XTOK_LOG_INFO("read " << n << " bytes");
#define XTOK_LOG_AT(level, msg)                                                                    \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream xtokLogLine_;                                                               \
    xtokLogLine_ << msg;                                                                           \
    xtok::core::Logger::log(xtok::core::Logger::Level::level, xtokLogLine_.str(), __FILE__,       \
                            __LINE__, __func__);                                                   \
  } while (0)

#define XTOK_LOG_TRACE(msg) XTOK_LOG_AT(Trace, msg)
#define XTOK_LOG_DEBUG(msg) XTOK_LOG_AT(Debug, msg)
#define XTOK_LOG_INFO(msg) XTOK_LOG_AT(Info, msg)
#define XTOK_LOG_WARN(msg) XTOK_LOG_AT(Warning, msg)
#define XTOK_LOG_ERROR(msg) XTOK_LOG_AT(Error, msg)
#define XTOK_LOG_FATAL(msg) XTOK_LOG_AT(Fatal, msg)

/// \brief printf-style logging with source location:
/// XTOK_LOG_WARNF("%zu bytes left", n);
#define XTOK_LOG_ATF(level, ...)                                                                   \
  xtok::core::Logger::logf(xtok::core::Logger::Level::level, __FILE__, __LINE__, __func__,         \
                           __VA_ARGS__)

#define XTOK_LOG_TRACEF(...) XTOK_LOG_ATF(Trace, __VA_ARGS__)
#define XTOK_LOG_DEBUGF(...) XTOK_LOG_ATF(Debug, __VA_ARGS__)
#define XTOK_LOG_INFOF(...) XTOK_LOG_ATF(Info, __VA_ARGS__)
#define XTOK_LOG_WARNF(...) XTOK_LOG_ATF(Warning, __VA_ARGS__)
#define XTOK_LOG_ERRORF(...) XTOK_LOG_ATF(Error, __VA_ARGS__)
#define XTOK_LOG_FATALF(...) XTOK_LOG_ATF(Fatal, __VA_ARGS__)
