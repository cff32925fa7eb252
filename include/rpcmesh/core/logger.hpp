// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
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

namespace rpcmesh
{
namespace core
{

namespace detail
{
  /// \brief Strip the directory part of __FILE__ at compile time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

/// \brief Process-wide, thread-safe logger with levels, a configurable line
/// format, date-based file rotation and an optional external sink.
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

  /// \brief Receives every emitted line when registered. The raw message is
  /// the text before formatting.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  /// \brief Configure level and destination.
  /// An empty filePath keeps console output; otherwise lines go to
  /// "<filePath>.<YYYY-MM-DD>.log" and files older than retentionDays are removed.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   int retentionDays = 7)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
    data.logBasePath = filePath;
    data.retentionDays = retentionDays;
    data.currentLogDate.clear();
    data.fileStream.reset();
    rotateLogFileIfNeeded();
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Route all output to handler instead of console/file.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
    if (data.fileStream)
    {
      data.fileStream->close();
      data.fileStream.reset();
    }
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
    data.currentLogDate.clear();
  }

  /// \brief Set the line format.
  /// Placeholders: %T timestamp, %t thread id, %L level, %m message,
  /// %F source file, %l source line, %f function, %% literal percent.
  /// Source placeholders are only filled by the RPCMESH_LOG_* macros.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.format = format;
    data.segments = compileFormat(format);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.format;
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  static bool isEnabled(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return level >= data.minLevel;
  }

  static void info(const std::string &message) { log(Level::Info, message); }
  static void error(const std::string &message) { log(Level::Error, message); }

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Emit a line carrying its source location.
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }
    if (data.segments.empty())
    {
      data.segments = compileFormat(data.format);
    }

    std::string output = render(level, message, file, line, function, data.segments);
    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
      return;
    }

    rotateLogFileIfNeeded();
    if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::cout << output;
    }
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
    default:
      return "UNKNOWN";
    }
  }

  /// \brief Parse a level name as written in configuration ("info", "WARN",
  /// "warning", ...). Returns nullopt for unknown names.
  static std::optional<Level> levelFromString(const std::string &name)
  {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
    {
      lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "trace")
      return Level::Trace;
    if (lower == "debug")
      return Level::Debug;
    if (lower == "info")
      return Level::Info;
    if (lower == "warn" || lower == "warning")
      return Level::Warning;
    if (lower == "error")
      return Level::Error;
    if (lower == "fatal")
      return Level::Fatal;
    return std::nullopt;
  }

private:
  enum class FormatToken
  {
    Literal,
    Timestamp,
    ThreadId,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal;
  };

  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel = Level::Info;
    std::string format = "[%T] [%L] %m";
    std::vector<FormatSegment> segments;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    std::unique_ptr<std::ofstream> fileStream;
    std::string logBasePath;
    std::string currentLogDate;
    int retentionDays = 7;
    ExternalHandler externalHandler;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static std::vector<FormatSegment> compileFormat(const std::string &format)
  {
    std::vector<FormatSegment> segments;
    std::string literal;
    auto flushLiteral = [&]()
    {
      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, literal});
        literal.clear();
      }
    };

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        literal += format[i];
        continue;
      }
      char code = format[i + 1];
      FormatToken token;
      switch (code)
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 't':
        token = FormatToken::ThreadId;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        literal += '%';
        ++i;
        continue;
      default:
        literal += format[i];
        continue;
      }
      flushLiteral();
      segments.push_back({token, ""});
      ++i;
    }
    flushLiteral();
    return segments;
  }

  static std::string timestamp(const std::string &timestampFormat)
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, timestampFormat.c_str());
    if (timestampFormat.find("%S") != std::string::npos)
    {
      oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
  }

  static std::string render(Level level, const std::string &message, const char *file, int line,
                            const char *function, const std::vector<FormatSegment> &segments)
  {
    auto &data = getData();
    std::ostringstream oss;
    for (const auto &seg : segments)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
        oss << timestamp(data.timestampFormat);
        break;
      case FormatToken::ThreadId:
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
            << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec;
        break;
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        if (file)
          oss << detail::basename(file);
        break;
      case FormatToken::Line:
        if (file)
          oss << line;
        break;
      case FormatToken::Function:
        if (function)
          oss << function;
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }

  static std::string currentDate()
  {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
  }

  // Caller holds data.mutex.
  static void rotateLogFileIfNeeded()
  {
    auto &data = getData();
    if (data.logBasePath.empty() || data.externalHandler)
    {
      return;
    }

    namespace fs = std::filesystem;
    auto logPath = fs::path(data.logBasePath);
    auto logDir = logPath.parent_path();
    if (logDir.empty())
    {
      logDir = fs::current_path();
    }
    std::error_code ec;
    if (!fs::exists(logDir, ec))
    {
      fs::create_directories(logDir, ec);
      if (ec)
      {
        std::cerr << "[Logger] Failed to create log directory: " << logDir << " - "
                  << ec.message() << std::endl;
        return;
      }
    }

    std::string today = currentDate();
    if (today == data.currentLogDate && data.fileStream)
    {
      return;
    }
    data.currentLogDate = today;
    auto rotatedPath = logDir / (logPath.filename().string() + "." + today + ".log");
    data.fileStream = std::make_unique<std::ofstream>(rotatedPath, std::ios::app);
    if (!data.fileStream->is_open())
    {
      std::cerr << "[Logger] Failed to open log file: " << rotatedPath << std::endl;
      data.fileStream.reset();
    }
    deleteOldLogFiles(logDir, logPath.filename().string() + ".");
  }

  static void deleteOldLogFiles(const std::filesystem::path &logDir, const std::string &prefix)
  {
    auto &data = getData();
    if (data.retentionDays <= 0)
    {
      return;
    }
    namespace fs = std::filesystem;
    auto now = std::chrono::system_clock::now();
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec))
    {
      std::string fname = entry.path().filename().string();
      if (fname.rfind(prefix, 0) != 0 || fname.size() < prefix.size() + 10)
      {
        continue;
      }
      std::tm tm{};
      std::istringstream ss(fname.substr(prefix.size(), 10));
      ss >> std::get_time(&tm, "%Y-%m-%d");
      if (ss.fail())
      {
        continue;
      }
      auto fileTime = std::chrono::system_clock::from_time_t(std::mktime(&tm));
      auto ageDays = std::chrono::duration_cast<std::chrono::hours>(now - fileTime).count() / 24;
      if (ageDays >= data.retentionDays)
      {
        std::error_code removeEc;
        fs::remove(entry.path(), removeEc);
        if (removeEc)
        {
          std::cerr << "[Logger] Failed to delete old log file: " << entry.path() << " - "
                    << removeEc.message() << std::endl;
        }
      }
    }
  }
};

/// \brief Stream-style logging with source location, e.g.
/// RPCMESH_LOG_INFO("provider " << id << " blacklisted");
#define RPCMESH_LOG_WITH_LEVEL(level, msg)                                                         \
  do                                                                                               \
  {                                                                                                \
    if (rpcmesh::core::Logger::isEnabled(rpcmesh::core::Logger::Level::level))                     \
    {                                                                                              \
      std::ostringstream _rpcmesh_oss;                                                             \
      _rpcmesh_oss << msg;                                                                         \
      rpcmesh::core::Logger::log(rpcmesh::core::Logger::Level::level, _rpcmesh_oss.str(),         \
                                 __FILE__, __LINE__, __func__);                                    \
    }                                                                                              \
  } while (0)

#define RPCMESH_LOG_TRACE(msg) RPCMESH_LOG_WITH_LEVEL(Trace, msg)
#define RPCMESH_LOG_DEBUG(msg) RPCMESH_LOG_WITH_LEVEL(Debug, msg)
#define RPCMESH_LOG_INFO(msg) RPCMESH_LOG_WITH_LEVEL(Info, msg)
#define RPCMESH_LOG_WARN(msg) RPCMESH_LOG_WITH_LEVEL(Warning, msg)
#define RPCMESH_LOG_ERROR(msg) RPCMESH_LOG_WITH_LEVEL(Error, msg)
#define RPCMESH_LOG_FATAL(msg) RPCMESH_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace rpcmesh
