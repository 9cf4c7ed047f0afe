// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
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
#include <thread>
#include <vector>

namespace edgeguard
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char* basename(const char* path)
  {
    const char* file = path;
    for (; *path; ++path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
    }
    return file;
  }

  /// \brief One log call as seen by the formatter
  struct LogRecord
  {
    const char* levelName;
    const std::string& message;
    const char* file;
    int line;
    const char* function;
  };

  /// \brief Pre-compiled log line layout
  ///
  /// Placeholders: %T timestamp, %t thread id (hex hash), %L level,
  /// %m message, %F source file name, %l source line, %f function,
  /// %% literal percent. Unknown placeholders are kept as text.
  class LineFormat
  {
  public:
    explicit LineFormat(const std::string& pattern) : _pattern(pattern) { compile(); }

    const std::string& pattern() const { return _pattern; }

    std::string render(const LogRecord& record, const std::string& timeFormat) const
    {
      std::ostringstream out;
      for (const auto& piece : _pieces)
      {
        if (piece.field == 0)
        {
          out << piece.text;
          continue;
        }
        switch (piece.field)
        {
        case 'T':
          out << timestamp(timeFormat);
          break;
        case 't':
          out << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
              << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec;
          break;
        case 'L':
          out << record.levelName;
          break;
        case 'm':
          out << record.message;
          break;
        case 'F':
          out << (record.file ? basename(record.file) : "");
          break;
        case 'l':
          if (record.file)
          {
            out << record.line;
          }
          break;
        case 'f':
          out << (record.function ? record.function : "");
          break;
        }
      }
      out << '\n';
      return out.str();
    }

  private:
    struct Piece
    {
      char field; ///< 0 for literal text
      std::string text;
    };

    void compile()
    {
      static const std::string fields = "TtLmFlf";
      std::string text;
      for (std::size_t i = 0; i < _pattern.size(); ++i)
      {
        char next = i + 1 < _pattern.size() ? _pattern[i + 1] : '\0';
        if (_pattern[i] == '%' && next == '%')
        {
          text += '%';
          ++i;
        }
        else if (_pattern[i] == '%' && next != '\0' && fields.find(next) != std::string::npos)
        {
          if (!text.empty())
          {
            _pieces.push_back({0, std::move(text)});
            text.clear();
          }
          _pieces.push_back({next, {}});
          ++i;
        }
        else
        {
          text += _pattern[i];
        }
      }
      if (!text.empty())
      {
        _pieces.push_back({0, std::move(text)});
      }
    }

    static std::string timestamp(const std::string& timeFormat)
    {
      auto now = std::chrono::system_clock::now();
      auto seconds = std::chrono::system_clock::to_time_t(now);
      auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
      std::tm local{};
      localtime_r(&seconds, &local);

      std::ostringstream out;
      out << std::put_time(&local, timeFormat.c_str());
      if (timeFormat.find("%S") != std::string::npos)
      {
        out << '.' << std::setfill('0') << std::setw(3) << millis.count();
      }
      return out.str();
    }

    std::string _pattern;
    std::vector<Piece> _pieces;
  };
} // namespace detail

/// \brief Thread-safe process logger with levels, a configurable line format,
/// console or file output, and an external handler hook.
///
/// Request-path components only ever call log(); the sink is guarded by a
/// single mutex so concurrent resolvers can share it.
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

  /// \brief External log handler function type
  /// Receives the level, the formatted line and the raw message.
  using ExternalHandler = std::function<void(Level level, const std::string& formattedMessage,
                                             const std::string& rawMessage)>;

  /// \brief Configure level and sink. An empty path logs to stdout.
  static void init(Level level = Level::Info, const std::string& filePath = "",
                   const std::string& timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto& state = getState();
    std::lock_guard<std::mutex> lock(state.mutex);

    state.minLevel = level;
    state.timeFormat = timeFormat;
    state.file.reset();
    if (filePath.empty())
    {
      return;
    }
    auto file = std::make_unique<std::ofstream>(filePath, std::ios::app);
    if (!file->is_open())
    {
      std::cerr << "[Logger] Failed to open log file: " << filePath << std::endl;
      return;
    }
    state.file = std::move(file);
  }

  static void flush()
  {
    auto& state = getState();
    std::lock_guard<std::mutex> lock(state.mutex);
    sinkOf(state).flush();
  }

  static void setLevel(Level level)
  {
    auto& state = getState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.minLevel = level;
  }

  static Level getLevel()
  {
    auto& state = getState();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.minLevel;
  }

  /// \brief Register an external log handler
  /// While a handler is registered, console and file output are suppressed.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto& state = getState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.handler = std::move(handler);
  }

  static void clearExternalHandler() { setExternalHandler(nullptr); }

  /// \brief Replace the line layout (see detail::LineFormat). Empty is ignored.
  static void setLogFormat(const std::string& format)
  {
    if (format.empty())
    {
      return;
    }
    auto& state = getState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.format = detail::LineFormat(format);
  }

  static std::string getLogFormat()
  {
    auto& state = getState();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.format.pattern();
  }

  /// \brief Parse a level name as written in configuration files
  /// Accepts trace, debug, info, warn/warning, error, fatal (any case).
  static std::optional<Level> parseLevel(const std::string& name)
  {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning")
    {
      return Level::Warning;
    }
    for (int i = 0; i <= static_cast<int>(Level::Fatal); ++i)
    {
      std::string candidate = levelToString(static_cast<Level>(i));
      std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (lower == candidate)
      {
        return static_cast<Level>(i);
      }
    }
    return std::nullopt;
  }

  static const char* levelToString(Level level)
  {
    static const char* const names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    auto index = static_cast<std::size_t>(level);
    return index < sizeof(names) / sizeof(names[0]) ? names[index] : "UNKNOWN";
  }

  static void trace(const std::string& message) { log(Level::Trace, message); }
  static void debug(const std::string& message) { log(Level::Debug, message); }
  static void info(const std::string& message) { log(Level::Info, message); }
  static void warning(const std::string& message) { log(Level::Warning, message); }
  static void error(const std::string& message) { log(Level::Error, message); }
  static void fatal(const std::string& message) { log(Level::Fatal, message); }

  static void log(Level level, const std::string& message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information
  /// \param file Source file name (from __FILE__), may be null
  /// \param line Source line number (from __LINE__)
  /// \param function Function name (from __func__), may be null
  static void log(Level level, const std::string& message, const char* file, int line,
                  const char* function)
  {
    auto& state = getState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (level < state.minLevel)
    {
      return;
    }

    detail::LogRecord record{levelToString(level), message, file, line, function};
    std::string output = state.format.render(record, state.timeFormat);
    if (state.handler)
    {
      state.handler(level, output, message);
      return;
    }
    auto& sink = sinkOf(state);
    sink << output;
    if (state.file)
    {
      sink.flush();
    }
  }

private:
  struct State
  {
    std::mutex mutex;
    Level minLevel = Level::Info;
    std::string timeFormat = "%Y-%m-%d %H:%M:%S";
    detail::LineFormat format{"[%T] [%L] %m"};
    std::unique_ptr<std::ofstream> file;
    ExternalHandler handler;
  };

  static State& getState()
  {
    static State state;
    return state;
  }

  /// \note Caller holds the logger mutex.
  static std::ostream& sinkOf(State& state)
  {
    if (state.file)
    {
      return *state.file;
    }
    return std::cout;
  }
};

/// \brief Stream-style logging macro with source location support
#define EDGEGUARD_LOG_WITH_LEVEL(level, msg)                                                       \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    edgeguard::core::Logger::log(edgeguard::core::Logger::Level::level, _oss.str(), __FILE__,      \
                                 __LINE__, __func__);                                              \
  } while (0)

#define EDGEGUARD_LOG_TRACE(msg) EDGEGUARD_LOG_WITH_LEVEL(Trace, msg)
#define EDGEGUARD_LOG_DEBUG(msg) EDGEGUARD_LOG_WITH_LEVEL(Debug, msg)
#define EDGEGUARD_LOG_INFO(msg) EDGEGUARD_LOG_WITH_LEVEL(Info, msg)
#define EDGEGUARD_LOG_WARN(msg) EDGEGUARD_LOG_WITH_LEVEL(Warning, msg)
#define EDGEGUARD_LOG_ERROR(msg) EDGEGUARD_LOG_WITH_LEVEL(Error, msg)
#define EDGEGUARD_LOG_FATAL(msg) EDGEGUARD_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace edgeguard
