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
#include <climits>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "socket_stream.hpp"

namespace ferry
{
namespace network
{

/// Native TLS state attached to one side of a relay session. The session
/// releases it exactly once, after both copiers are gone.
class TlsHandle
{
public:
  virtual ~TlsHandle() = default;

  /// Release the native resources. Idempotent.
  virtual void free() = 0;

  virtual bool isFreed() const = 0;
};

/// Owns an established OpenSSL session and, optionally, the context it was
/// created from.
class OpenSslHandle : public TlsHandle
{
public:
  explicit OpenSslHandle(SSL *ssl, SSL_CTX *ctx = nullptr) : _ssl(ssl), _ctx(ctx) {}

  ~OpenSslHandle() override { free(); }

  OpenSslHandle(const OpenSslHandle &) = delete;
  OpenSslHandle &operator=(const OpenSslHandle &) = delete;

  void free() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_ssl)
    {
      ::SSL_free(_ssl);
      _ssl = nullptr;
    }
    if (_ctx)
    {
      ::SSL_CTX_free(_ctx);
      _ctx = nullptr;
    }
    _freed = true;
  }

  bool isFreed() const override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _freed;
  }

  /// Null once freed.
  SSL *ssl() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _ssl;
  }

private:
  mutable std::mutex _mutex;
  SSL *_ssl;
  SSL_CTX *_ctx;
  bool _freed{false};
};

/// Keeps SIGPIPE raised by OpenSSL's plain write(2) on a dead socket from
/// reaching the process. SIGPIPE is blocked on the calling thread for the
/// guard's lifetime; one raised meanwhile is consumed before unblocking.
class SigpipeGuard
{
public:
  SigpipeGuard()
  {
    ::sigemptyset(&_pipe);
    ::sigaddset(&_pipe, SIGPIPE);
    sigset_t pending;
    ::sigemptyset(&pending);
    _wasPending = ::sigpending(&pending) == 0 && ::sigismember(&pending, SIGPIPE) == 1;
    _blocked = ::pthread_sigmask(SIG_BLOCK, &_pipe, &_previous) == 0;
  }

  ~SigpipeGuard()
  {
    if (!_blocked)
    {
      return;
    }
    int savedErrno = errno;
    if (!_wasPending)
    {
      sigset_t pending;
      ::sigemptyset(&pending);
      if (::sigpending(&pending) == 0 && ::sigismember(&pending, SIGPIPE) == 1)
      {
        timespec zero{0, 0};
        while (::sigtimedwait(&_pipe, nullptr, &zero) == -1 && errno == EINTR)
        {
        }
      }
    }
    ::pthread_sigmask(SIG_SETMASK, &_previous, nullptr);
    errno = savedErrno;
  }

  SigpipeGuard(const SigpipeGuard &) = delete;
  SigpipeGuard &operator=(const SigpipeGuard &) = delete;

private:
  sigset_t _pipe;
  sigset_t _previous;
  bool _wasPending{false};
  bool _blocked{false};
};

/// Stream over an already-handshaken OpenSSL session. The SSL object is
/// borrowed (normally from an OpenSslHandle) and must outlive close(); the
/// socket underneath is owned and switched to non-blocking mode.
///
/// An SSL object must not be entered by two threads at once, so every SSL_*
/// call runs under _sslMutex and the wait for socket readiness happens
/// outside it. This lets one copier read while the other writes. SSL calls
/// that may write to the socket run under a SigpipeGuard.
class TlsStream : public Stream
{
public:
  TlsStream(SSL *ssl, std::unique_ptr<SocketStream> transport,
            std::chrono::milliseconds ioTimeout = std::chrono::milliseconds(0))
      : _ssl(ssl), _transport(std::move(transport)), _ioTimeout(ioTimeout)
  {
    int flags = ::fcntl(_transport->fd(), F_GETFL, 0);
    if (flags >= 0)
    {
      ::fcntl(_transport->fd(), F_SETFL, flags | O_NONBLOCK);
    }
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Peers that drop TCP without close_notify read as a plain EOF.
    ::SSL_set_options(_ssl, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
  }

  ~TlsStream() override { close(); }

  TlsStream(const TlsStream &) = delete;
  TlsStream &operator=(const TlsStream &) = delete;

  IoResult read(std::uint8_t *data, std::size_t size, std::size_t &transferred) override
  {
    transferred = 0;
    int want = size > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(size);
    auto deadline = MonoClock::now() + _ioTimeout;
    while (true)
    {
      int n = 0;
      int sslError = SSL_ERROR_NONE;
      int sysErrno = 0;
      {
        std::lock_guard<std::mutex> lock(_sslMutex);
        if (_closed.load())
        {
          return IoResult::closedStream();
        }
        SigpipeGuard noSigpipe;
        ::ERR_clear_error();
        n = ::SSL_read(_ssl, data, want);
        if (n > 0)
        {
          transferred = static_cast<std::size_t>(n);
          return IoResult::success();
        }
        sysErrno = errno;
        sslError = ::SSL_get_error(_ssl, n);
      }
      if (sslError == SSL_ERROR_WANT_READ || sslError == SSL_ERROR_WANT_WRITE)
      {
        if (!waitReady(sslError == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline))
        {
          return IoResult::timeout("Read timed out");
        }
        continue;
      }
      return mapSslError(sslError, sysErrno, "SSL_read");
    }
  }

  IoResult write(const std::uint8_t *data, std::size_t size, std::size_t &transferred) override
  {
    transferred = 0;
    auto deadline = MonoClock::now() + _ioTimeout;
    while (transferred < size)
    {
      std::size_t left = size - transferred;
      int want = left > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(left);
      int n = 0;
      int sslError = SSL_ERROR_NONE;
      int sysErrno = 0;
      {
        std::lock_guard<std::mutex> lock(_sslMutex);
        if (_closed.load())
        {
          return IoResult::closedStream();
        }
        SigpipeGuard noSigpipe;
        ::ERR_clear_error();
        n = ::SSL_write(_ssl, data + transferred, want);
        if (n > 0)
        {
          transferred += static_cast<std::size_t>(n);
          deadline = MonoClock::now() + _ioTimeout;
          continue;
        }
        sysErrno = errno;
        sslError = ::SSL_get_error(_ssl, n);
      }
      if (sslError == SSL_ERROR_WANT_READ || sslError == SSL_ERROR_WANT_WRITE)
      {
        if (!waitReady(sslError == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline))
        {
          return IoResult::timeout("Write timed out");
        }
        continue;
      }
      IoResult r = mapSslError(sslError, sysErrno, "SSL_write");
      if (r.ok)
      {
        return IoResult::failure(TransportError::PeerClosed, "TLS peer closed");
      }
      return r;
    }
    return IoResult::success();
  }

  void interrupt() override { _transport->interrupt(); }

  /// Sends close_notify when the socket is still usable, then closes it.
  void close() override
  {
    std::lock_guard<std::mutex> lock(_sslMutex);
    if (_closed.exchange(true))
    {
      return;
    }
    if (_ssl && !_transport->isClosed())
    {
      if (_transport->isInterrupted())
      {
        ::SSL_set_quiet_shutdown(_ssl, 1);
      }
      SigpipeGuard noSigpipe;
      ::ERR_clear_error();
      ::SSL_shutdown(_ssl);
      ::ERR_clear_error();
    }
    _transport->close();
  }

  bool isClosed() const override { return _closed.load(); }

  std::string describe() const override { return "tls+" + _transport->describe(); }

  SocketStream &transport() { return *_transport; }

private:
  /// Block until the socket is ready for events or the deadline passes.
  /// Returns false on timeout.
  bool waitReady(short events, MonoTime deadline) const
  {
    while (true)
    {
      int timeoutMs = -1;
      if (_ioTimeout.count() > 0)
      {
        auto left =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - MonoClock::now());
        if (left.count() <= 0)
        {
          return false;
        }
        timeoutMs = static_cast<int>(left.count());
      }
      pollfd pfd{};
      pfd.fd = _transport->fd();
      pfd.events = events;
      int rc = ::poll(&pfd, 1, timeoutMs);
      if (rc > 0)
      {
        return true;
      }
      if (rc == 0)
      {
        return false;
      }
      if (errno != EINTR)
      {
        // Let the next SSL call surface the descriptor error.
        return true;
      }
    }
  }

  IoResult mapSslError(int sslError, int sysErrno, const char *op) const
  {
    switch (sslError)
    {
    case SSL_ERROR_ZERO_RETURN:
      return IoResult::success();
    case SSL_ERROR_SYSCALL:
    {
      if (::ERR_peek_error() == 0)
      {
        if (sysErrno == 0)
        {
          return IoResult::success();
        }
        if (sysErrno == EAGAIN || sysErrno == EWOULDBLOCK)
        {
          return IoResult::timeout("Read timed out", sysErrno);
        }
        if (sysErrno == EBADF)
        {
          return IoResult::failure(TransportError::StreamClosed, "Closed stream", sysErrno);
        }
        if (sysErrno == ECONNRESET || sysErrno == EPIPE)
        {
          return IoResult::failure(TransportError::PeerClosed,
                                   std::string(op) + ": " + std::strerror(sysErrno), sysErrno);
        }
        return IoResult::failure(TransportError::Socket,
                                 std::string(op) + ": " + std::strerror(sysErrno), sysErrno);
      }
      break;
    }
    default:
      break;
    }
    unsigned long e = ::ERR_get_error();
    char msg[256];
    ::ERR_error_string_n(e, msg, sizeof(msg));
    ::ERR_clear_error();
    return IoResult::failure(TransportError::TLSIO, std::string(op) + ": " + msg, sysErrno,
                             sslError);
  }

  SSL *_ssl;
  std::unique_ptr<SocketStream> _transport;
  std::chrono::milliseconds _ioTimeout;
  std::atomic<bool> _closed{false};
  std::mutex _sslMutex;
};

} // namespace network
} // namespace ferry
