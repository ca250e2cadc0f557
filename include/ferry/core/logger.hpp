// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ferry
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
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

/// \brief Thread-safe process-wide logger with levels, optional async
/// delivery, daily file rotation with retention, and an external handler hook.
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

  /// \brief External log handler: level, formatted line, raw message.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  /// \brief Configure the logger. An empty filePath logs to stdout.
  static void init(Level level = Level::Info, const std::string &filePath = "", bool async = false,
                   int retentionDays = 7, const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    {
      std::lock_guard<std::mutex> lock(data.mutex);
      data.minLevel = level;
      data.asyncMode = async;
      data.exit = false;
      data.logBasePath = filePath;
      data.retentionDays = retentionDays;
      data.timestampFormat = timeFormat;
      data.currentLogDate.clear();
      data.fileStream.reset();
      rotateLogFileIfNeeded();
    }

    if (async && !data.workerThread.joinable())
    {
      data.workerThread = std::thread(runWorker);
    }
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

  /// \brief Route every log line to handler instead of file/stdout.
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

  /// \brief Set the line format. Placeholders:
  ///   %T timestamp, %t thread id, %L level, %m message,
  ///   %F file, %l line, %f function, %% literal percent.
  /// Empty formats are ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location (used by the FERRY_LOG_* macros).
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::string output = format(level, message, file, line, function, data.logFormat,
                                data.timestampFormat);
    if (data.asyncMode)
    {
      data.queue.push({level, std::move(output), message});
      lock.unlock();
      data.cv.notify_one();
      return;
    }

    if (data.externalHandler)
    {
      auto handler = data.externalHandler;
      lock.unlock();
      handler(level, output, message);
      return;
    }
    write(output);
  }

  /// \brief Drain queued entries (async mode) and flush the file stream.
  static void flush()
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    drain(lock);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
  }

  static void shutdown()
  {
    flush();
    auto &data = getData();
    {
      std::lock_guard<std::mutex> lock(data.mutex);
      data.exit = true;
      data.asyncMode = false;
    }
    data.cv.notify_one();
    if (data.workerThread.joinable())
    {
      data.workerThread.join();
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

  /// \brief Local date used in rotated file names (YYYY-MM-DD).
  static std::string currentDate()
  {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    ::localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
  }

private:
  struct Entry
  {
    Level level;
    std::string formatted;
    std::string raw;
  };

  struct LoggerData
  {
    std::mutex mutex;
    std::condition_variable cv;
    std::queue<Entry> queue;
    std::thread workerThread;
    std::atomic<bool> exit{false};
    bool asyncMode = false;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string logBasePath;
    std::string currentLogDate;
    int retentionDays = 7;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    std::string logFormat = "[%T] [%L] %m";
    ExternalHandler externalHandler;

    ~LoggerData()
    {
      exit = true;
      cv.notify_all();
      if (workerThread.joinable())
      {
        workerThread.join();
      }
    }
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static void runWorker()
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    while (true)
    {
      data.cv.wait(lock, [&data] { return !data.queue.empty() || data.exit; });
      drain(lock);
      if (data.exit)
      {
        break;
      }
    }
  }

  /// Caller holds lock. External handlers run with the lock released.
  static void drain(std::unique_lock<std::mutex> &lock)
  {
    auto &data = getData();
    while (!data.queue.empty())
    {
      Entry entry = std::move(data.queue.front());
      data.queue.pop();
      if (data.externalHandler)
      {
        auto handler = data.externalHandler;
        lock.unlock();
        handler(entry.level, entry.formatted, entry.raw);
        lock.lock();
      }
      else
      {
        write(entry.formatted);
      }
    }
  }

  /// Caller holds the data mutex.
  static void write(const std::string &output)
  {
    auto &data = getData();
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

  /// Caller holds the data mutex.
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
    std::string rotatedPath =
      (logDir / (logPath.filename().string() + "." + today + ".log")).string();
    data.fileStream = std::make_unique<std::ofstream>(rotatedPath, std::ios::app);
    if (!data.fileStream->is_open())
    {
      std::cerr << "[Logger] Failed to open rotated log file: " << rotatedPath << std::endl;
      data.fileStream.reset();
      return;
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

      // baseName.YYYY-MM-DD.log
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

  static std::string timestamp(const std::string &timeFormat)
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    ::localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, timeFormat.c_str());
    if (timeFormat.find("%S") != std::string::npos)
    {
      oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
  }

  static std::string format(Level level, const std::string &message, const char *file, int line,
                            const char *function, const std::string &logFormat,
                            const std::string &timeFormat)
  {
    std::ostringstream oss;
    for (std::size_t i = 0; i < logFormat.size(); ++i)
    {
      char c = logFormat[i];
      if (c != '%' || i + 1 >= logFormat.size())
      {
        oss << c;
        continue;
      }

      switch (logFormat[++i])
      {
      case 'T':
        oss << timestamp(timeFormat);
        break;
      case 't':
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
            << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec;
        break;
      case 'L':
        oss << levelToString(level);
        break;
      case 'm':
        oss << message;
        break;
      case 'F':
        if (file)
        {
          oss << detail::basename(file);
        }
        break;
      case 'l':
        if (file)
        {
          oss << line;
        }
        break;
      case 'f':
        if (function)
        {
          oss << function;
        }
        break;
      case '%':
        oss << '%';
        break;
      default:
        // Unknown placeholder, keep it verbatim
        oss << '%' << logFormat[i];
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }
};

} // namespace core
} // namespace ferry

/// \brief Stream-style logging macro with source location support
#define FERRY_LOG_WITH_LEVEL(level, msg)                                                           \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    ferry::core::Logger::log(ferry::core::Logger::Level::level, _oss.str(), __FILE__, __LINE__,    \
                             __func__);                                                            \
  } while (0)

#define FERRY_LOG_TRACE(msg) FERRY_LOG_WITH_LEVEL(Trace, msg)
#define FERRY_LOG_DEBUG(msg) FERRY_LOG_WITH_LEVEL(Debug, msg)
#define FERRY_LOG_INFO(msg) FERRY_LOG_WITH_LEVEL(Info, msg)
#define FERRY_LOG_WARN(msg) FERRY_LOG_WITH_LEVEL(Warning, msg)
#define FERRY_LOG_ERROR(msg) FERRY_LOG_WITH_LEVEL(Error, msg)
#define FERRY_LOG_FATAL(msg) FERRY_LOG_WITH_LEVEL(Fatal, msg)
