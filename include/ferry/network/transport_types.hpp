// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#ifndef __linux__
#error "Linux-only (SO_RCVTIMEO/MSG_NOSIGNAL)"
#endif

#include <chrono>
#include <cstdint>
#include <string>

namespace ferry
{
namespace network
{

using SessionId = std::uint64_t;
using MonoClock = std::chrono::steady_clock;
using MonoTime = std::chrono::time_point<MonoClock>;

/// Which end of a relay session a stream or TLS handle belongs to.
enum class Side
{
  Client,
  Remote
};

inline const char *toString(Side side) { return side == Side::Client ? "client" : "remote"; }

enum class TransportError
{
  None = 0,
  Socket,
  TLSIO,
  PeerClosed,
  StreamClosed,
  Timeout,
  Cancelled,
  Unknown
};

inline const char *toString(TransportError code)
{
  switch (code)
  {
  case TransportError::None:
    return "None";
  case TransportError::Socket:
    return "Socket";
  case TransportError::TLSIO:
    return "TLSIO";
  case TransportError::PeerClosed:
    return "PeerClosed";
  case TransportError::StreamClosed:
    return "StreamClosed";
  case TransportError::Timeout:
    return "Timeout";
  case TransportError::Cancelled:
    return "Cancelled";
  default:
    return "Unknown";
  }
}

/// Outcome of a single stream operation. Transport code never throws for
/// I/O failures; it reports them through this struct.
struct IoResult
{
  bool ok{true};
  TransportError code{TransportError::None};
  std::string message;
  int sysErrno{0};
  int tlsError{0};

  static IoResult success() { return {true, TransportError::None, "", 0, 0}; }

  static IoResult failure(TransportError c, const std::string &m, int se = 0, int te = 0)
  {
    return {false, c, m, se, te};
  }

  /// Failure reported for any operation on a stream that was closed locally.
  static IoResult closedStream() { return failure(TransportError::StreamClosed, "Closed stream"); }

  static IoResult timeout(const std::string &m = "Read timed out", int se = 0)
  {
    return failure(TransportError::Timeout, m, se);
  }
};

} // namespace network
} // namespace ferry
