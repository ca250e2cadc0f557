// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Shared test helpers for Ferry test suite
// This file contains common utilities used across multiple test files

#pragma once

#include "ferry/ferry.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace ferry::test
{

/// \brief Automatic logger initialization for tests
struct LoggerInit
{
  LoggerInit() { ferry::core::Logger::setLevel(ferry::core::Logger::Level::Debug); }
};

/// \brief Static logger initializer - call once per test executable
inline void initializeTestLogging()
{
  static LoggerInit init;
  (void)init;
}

/// \brief Helper for testing with temporary directories
class TempDirManager
{
public:
  TempDirManager(const std::string &prefix = "ferry_test_")
      : _dir("/tmp/" + prefix + std::to_string(std::time(nullptr)) + "_" +
             std::to_string(::getpid()))
  {
    std::filesystem::create_directories(_dir);
  }

  ~TempDirManager()
  {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
  }

  const std::string &path() const { return _dir; }
  std::string filePath(const std::string &filename) const { return _dir + "/" + filename; }

  /// \brief Write content to filename inside the directory and return its path.
  std::string writeFile(const std::string &filename, const std::string &content) const
  {
    std::string path = filePath(filename);
    std::ofstream out(path);
    out << content;
    return path;
  }

private:
  std::string _dir;
};

/// \brief Helper to wait for a condition with timeout
template <typename Predicate>
bool waitFor(Predicate pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
  auto start = std::chrono::steady_clock::now();
  while (!pred())
  {
    if (std::chrono::steady_clock::now() - start > timeout)
    {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

/// \brief Connected AF_UNIX stream socket pair. Ends not released are
/// closed on destruction.
class SocketPair
{
public:
  SocketPair()
  {
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, _fds) != 0)
    {
      throw std::runtime_error("socketpair failed");
    }
  }

  ~SocketPair()
  {
    for (int &fd : _fds)
    {
      if (fd >= 0)
      {
        ::close(fd);
      }
    }
  }

  SocketPair(const SocketPair &) = delete;
  SocketPair &operator=(const SocketPair &) = delete;

  int first() const { return _fds[0]; }
  int second() const { return _fds[1]; }

  /// \brief Give up ownership of one end (0 or 1).
  int release(int end)
  {
    int fd = _fds[end];
    _fds[end] = -1;
    return fd;
  }

private:
  int _fds[2]{-1, -1};
};

/// \brief Write all of data to fd (blocking).
inline bool writeAll(int fd, const std::string &data)
{
  std::size_t off = 0;
  while (off < data.size())
  {
    ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n <= 0)
    {
      return false;
    }
    off += static_cast<std::size_t>(n);
  }
  return true;
}

/// \brief Read from fd until EOF, error, or expected bytes have arrived.
inline std::string readUpTo(int fd, std::size_t expected,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  std::string out;
  char buf[4096];
  while (out.size() < expected)
  {
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n <= 0)
    {
      break;
    }
    out.append(buf, static_cast<std::size_t>(n));
  }
  return out;
}

/// \brief Stream driven by a script of read outcomes. Once the script runs
/// out, every read returns the fallback outcome. Writes are captured.
/// Any read or write after close() is recorded as a use-after-close.
class ScriptedStream : public ferry::network::Stream
{
public:
  struct Step
  {
    ferry::network::IoResult result;
    std::string data;
    std::chrono::milliseconds delay{0};
  };

  static Step chunk(const std::string &data) { return {ferry::network::IoResult::success(), data}; }
  static Step eof() { return {ferry::network::IoResult::success(), ""}; }
  static Step timeout() { return {ferry::network::IoResult::timeout(), ""}; }
  static Step closed() { return {ferry::network::IoResult::closedStream(), ""}; }
  static Step fatal()
  {
    return {ferry::network::IoResult::failure(ferry::network::TransportError::PeerClosed,
                                              "Connection reset by peer", ECONNRESET),
            ""};
  }

  explicit ScriptedStream(std::string name = "scripted", Step fallback = eof())
      : _name(std::move(name)), _fallback(std::move(fallback))
  {
  }

  ScriptedStream &then(Step step)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _script.push_back(std::move(step));
    return *this;
  }

  /// The next write accepts at most bytes, then reports a write timeout.
  ScriptedStream &stallNextWriteAfter(std::size_t bytes)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _stallAfter = bytes;
    return *this;
  }

  ScriptedStream &thenRepeat(const Step &step, int times)
  {
    for (int i = 0; i < times; ++i)
    {
      then(step);
    }
    return *this;
  }

  ferry::network::IoResult read(std::uint8_t *data, std::size_t size,
                                std::size_t &transferred) override
  {
    transferred = 0;
    Step step;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      ++_reads;
      if (_closed)
      {
        _usedAfterClose = true;
        return ferry::network::IoResult::closedStream();
      }
      if (_interrupted)
      {
        return ferry::network::IoResult::success();
      }
      if (_script.empty())
      {
        step = _fallback;
      }
      else
      {
        step = std::move(_script.front());
        _script.pop_front();
      }
    }
    if (step.delay.count() > 0)
    {
      std::this_thread::sleep_for(step.delay);
    }
    std::size_t n = std::min(size, step.data.size());
    std::copy(step.data.begin(), step.data.begin() + static_cast<std::ptrdiff_t>(n), data);
    transferred = n;
    return step.result;
  }

  ferry::network::IoResult write(const std::uint8_t *data, std::size_t size,
                                 std::size_t &transferred) override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    transferred = 0;
    if (_closed)
    {
      _usedAfterClose = true;
      return ferry::network::IoResult::closedStream();
    }
    if (_stallAfter)
    {
      std::size_t n = std::min(size, *_stallAfter);
      _stallAfter.reset();
      _written.append(reinterpret_cast<const char *>(data), n);
      transferred = n;
      ++_stalls;
      return ferry::network::IoResult::timeout("Write timed out");
    }
    _written.append(reinterpret_cast<const char *>(data), size);
    transferred = size;
    return ferry::network::IoResult::success();
  }

  void interrupt() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _interrupted = true;
    ++_interrupts;
  }

  void close() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_closed)
    {
      _closed = true;
      ++_closes;
    }
  }

  bool isClosed() const override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _closed;
  }

  std::string describe() const override { return _name; }

  std::string written() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _written;
  }

  int reads() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _reads;
  }

  int closes() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _closes;
  }

  int interrupts() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _interrupts;
  }

  int stalls() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _stalls;
  }

  bool usedAfterClose() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _usedAfterClose;
  }

private:
  mutable std::mutex _mutex;
  std::string _name;
  Step _fallback;
  std::deque<Step> _script;
  std::string _written;
  int _reads{0};
  int _closes{0};
  int _interrupts{0};
  int _stalls{0};
  std::optional<std::size_t> _stallAfter;
  bool _closed{false};
  bool _interrupted{false};
  bool _usedAfterClose{false};
};

/// \brief TLS handle that counts every free() call and runs a callback on the
/// first one (e.g. to check the stream was already closed).
class RecordingTlsHandle : public ferry::network::TlsHandle
{
public:
  explicit RecordingTlsHandle(std::atomic<int> &frees, std::function<void()> onFree = nullptr)
      : _frees(frees), _onFree(std::move(onFree))
  {
  }

  void free() override
  {
    _frees.fetch_add(1);
    if (!_freed.exchange(true) && _onFree)
    {
      _onFree();
    }
  }

  bool isFreed() const override { return _freed.load(); }

private:
  std::atomic<int> &_frees;
  std::function<void()> _onFree;
  std::atomic<bool> _freed{false};
};

/// \brief Relay settings tuned for fast tests.
inline ferry::network::RelayConfig fastRelayConfig()
{
  ferry::network::RelayConfig config;
  config.aliveInterval = std::chrono::seconds(5);
  config.heartbeatInterval = std::chrono::milliseconds(20);
  config.retryBackoff = std::chrono::milliseconds(2);
  config.maxClosedCycles = 3;
  return config;
}

} // namespace ferry::test
