// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "stream.hpp"

namespace ferry
{
namespace network
{

/// Blocking stream over a connected socket descriptor. An ioTimeout of zero
/// leaves reads and writes blocking indefinitely; otherwise they report
/// Timeout after that long without progress. Streams handed to a
/// RelaySession need a finite ioTimeout for its idle check to run.
class SocketStream : public Stream
{
public:
  explicit SocketStream(int fd, std::chrono::milliseconds ioTimeout = std::chrono::milliseconds(0),
                        bool ownsFd = true)
      : _fd(fd), _ownsFd(ownsFd)
  {
    if (ioTimeout.count() > 0)
    {
      timeval tv{};
      tv.tv_sec = static_cast<time_t>(ioTimeout.count() / 1000);
      tv.tv_usec = static_cast<suseconds_t>((ioTimeout.count() % 1000) * 1000);
      ::setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
      ::setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
  }

  ~SocketStream() override { close(); }

  SocketStream(const SocketStream &) = delete;
  SocketStream &operator=(const SocketStream &) = delete;

  IoResult read(std::uint8_t *data, std::size_t size, std::size_t &transferred) override
  {
    transferred = 0;
    if (_closed.load())
    {
      return IoResult::closedStream();
    }
    while (true)
    {
      ssize_t n = ::recv(_fd, data, size, 0);
      if (n >= 0)
      {
        transferred = static_cast<std::size_t>(n);
        return IoResult::success();
      }
      int err = errno;
      if (err == EINTR)
      {
        continue;
      }
      return mapErrno(err, "recv");
    }
  }

  IoResult write(const std::uint8_t *data, std::size_t size, std::size_t &transferred) override
  {
    transferred = 0;
    if (_closed.load())
    {
      return IoResult::closedStream();
    }
    while (transferred < size)
    {
      ssize_t n = ::send(_fd, data + transferred, size - transferred, MSG_NOSIGNAL);
      if (n > 0)
      {
        transferred += static_cast<std::size_t>(n);
        continue;
      }
      int err = errno;
      if (n < 0 && err == EINTR)
      {
        continue;
      }
      if (n == 0)
      {
        return IoResult::failure(TransportError::PeerClosed, "send made no progress");
      }
      if (err == EAGAIN || err == EWOULDBLOCK)
      {
        return IoResult::timeout("Write timed out", err);
      }
      return mapErrno(err, "send");
    }
    return IoResult::success();
  }

  void interrupt() override
  {
    std::lock_guard<std::mutex> lock(_fdMutex);
    if (!_closed.load() && _fd >= 0)
    {
      ::shutdown(_fd, SHUT_RDWR);
      _interrupted = true;
    }
  }

  void close() override
  {
    std::lock_guard<std::mutex> lock(_fdMutex);
    if (_closed.exchange(true))
    {
      return;
    }
    if (_fd >= 0 && _ownsFd)
    {
      ::shutdown(_fd, SHUT_RDWR);
      ::close(_fd);
    }
  }

  bool isClosed() const override { return _closed.load(); }

  bool isInterrupted() const
  {
    std::lock_guard<std::mutex> lock(_fdMutex);
    return _interrupted;
  }

  std::string describe() const override { return "fd:" + std::to_string(_fd); }

  int fd() const { return _fd; }

private:
  static IoResult mapErrno(int err, const char *op)
  {
    std::string msg = std::string(op) + ": " + std::strerror(err);
    switch (err)
    {
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return IoResult::timeout("Read timed out", err);
    case EBADF:
    case ENOTSOCK:
      return IoResult::failure(TransportError::StreamClosed, "Closed stream", err);
    case ECONNRESET:
    case EPIPE:
      return IoResult::failure(TransportError::PeerClosed, msg, err);
    default:
      return IoResult::failure(TransportError::Socket, msg, err);
    }
  }

  int _fd;
  bool _ownsFd;
  std::atomic<bool> _closed{false};
  bool _interrupted{false};
  mutable std::mutex _fdMutex;
};

} // namespace network
} // namespace ferry
