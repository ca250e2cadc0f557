// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cstdint>
#include <optional>

#include "transport_types.hpp"

namespace ferry
{
namespace network
{

enum class ErrorClass
{
  None,         // Attempt ended without error (EOF or nothing to read)
  Timeout,      // Read timed out; retried while the session is alive
  ClosedStream, // Generic I/O error carrying a closed-stream indication
  Fatal         // Anything else; the copier stops immediately
};

/// What a directional copier saw on its latest copy attempt.
struct CloseObservation
{
  std::optional<IoResult> lastError; // Empty when the attempt raised no error
  std::int64_t lastChunkSize{0};     // Bytes moved by the attempt
  std::int64_t cyclesElapsed{0};     // Consecutive "probably closed" attempts
};

/// Turns ambiguous end-of-stream signals into a stop decision. A single
/// zero-byte read or a single "closed" error is not trusted; only a run of
/// maxClosedCycles of them is.
class CloseHeuristic
{
public:
  explicit CloseHeuristic(std::int64_t maxClosedCycles = 10) : _maxClosedCycles(maxClosedCycles) {}

  static ErrorClass classify(const IoResult &result)
  {
    if (result.ok)
    {
      return ErrorClass::None;
    }
    switch (result.code)
    {
    case TransportError::None:
      return ErrorClass::None;
    case TransportError::Timeout:
      return ErrorClass::Timeout;
    case TransportError::StreamClosed:
      return ErrorClass::ClosedStream;
    default:
      return ErrorClass::Fatal;
    }
  }

  static ErrorClass classify(const std::optional<IoResult> &result)
  {
    return result ? classify(*result) : ErrorClass::None;
  }

  /// True when an attempt with this outcome counts toward the closed-cycle run.
  static bool isClosedCandidate(const std::optional<IoResult> &error, std::int64_t chunkSize)
  {
    if (chunkSize != 0)
    {
      return false;
    }
    auto cls = classify(error);
    return cls == ErrorClass::None || cls == ErrorClass::ClosedStream;
  }

  bool isEffectivelyClosed(const std::optional<IoResult> &error, std::int64_t lastChunkSize,
                           std::int64_t cyclesElapsed) const
  {
    bool cyclesExhausted = _maxClosedCycles <= cyclesElapsed;
    bool sizeZero = lastChunkSize == 0;

    if (classify(error) == ErrorClass::None && sizeZero && cyclesExhausted)
    {
      return true;
    }

    bool closedStream = classify(error) == ErrorClass::ClosedStream;
    return closedStream && sizeZero && cyclesExhausted;
  }

  bool evaluate(const CloseObservation &obs) const
  {
    return isEffectivelyClosed(obs.lastError, obs.lastChunkSize, obs.cyclesElapsed);
  }

  std::int64_t maxClosedCycles() const { return _maxClosedCycles; }

private:
  std::int64_t _maxClosedCycles;
};

} // namespace network
} // namespace ferry
