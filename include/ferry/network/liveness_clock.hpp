// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <mutex>
#include <optional>

#include "transport_types.hpp"

namespace ferry
{
namespace network
{

/// Shared "last observed activity" timestamp for one relay session. Both
/// copiers, the per-chunk progress hook and heartbeat ticks touch it; the
/// copiers read it to decide idle timeout.
class LivenessClock
{
public:
  LivenessClock() = default;
  LivenessClock(const LivenessClock &) = delete;
  LivenessClock &operator=(const LivenessClock &) = delete;

  void touch() { touchAt(MonoClock::now()); }

  /// Record activity at an explicit instant. Never moves the clock backwards.
  void touchAt(MonoTime when)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_lastAlive || *_lastAlive < when)
    {
      _lastAlive = when;
    }
    ++_touches;
  }

  /// Empty until the first touch.
  std::optional<MonoTime> lastAlive() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastAlive;
  }

  /// Time since the last touch, or nullopt if there never was one.
  std::optional<std::chrono::milliseconds> idleFor(MonoTime now = MonoClock::now()) const
  {
    auto last = lastAlive();
    if (!last)
    {
      return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - *last);
  }

  /// True when more than aliveInterval has passed since the last touch.
  /// A clock that was never touched counts as expired.
  bool isExpired(std::chrono::milliseconds aliveInterval, MonoTime now = MonoClock::now()) const
  {
    auto idle = idleFor(now);
    return !idle || *idle > aliveInterval;
  }

  std::uint64_t touches() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _touches;
  }

private:
  mutable std::mutex _mutex;
  std::optional<MonoTime> _lastAlive;
  std::uint64_t _touches{0};
};

} // namespace network
} // namespace ferry
