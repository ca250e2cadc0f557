// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "transport_types.hpp"

namespace ferry
{
namespace network
{

/// Blocking, bidirectional byte stream handed to a relay session by whoever
/// accepted or connected it.
///
/// read/write may run concurrently with each other (one reader thread, one
/// writer thread) and with interrupt(). close() must only be called once no
/// thread is inside read/write; the relay session guarantees this.
class Stream
{
public:
  virtual ~Stream() = default;

  /// Read up to size bytes. transferred == 0 with an ok result means EOF.
  virtual IoResult read(std::uint8_t *data, std::size_t size, std::size_t &transferred) = 0;

  /// Write all size bytes. On failure transferred holds what was written
  /// before the error.
  virtual IoResult write(const std::uint8_t *data, std::size_t size, std::size_t &transferred) = 0;

  /// Wake any blocked read/write and make later ones fail or hit EOF, without
  /// releasing the underlying descriptor.
  virtual void interrupt() = 0;

  /// Release the underlying resources. Idempotent and never throws.
  virtual void close() = 0;

  virtual bool isClosed() const = 0;

  virtual std::string describe() const { return "stream"; }
};

/// Result of one copy attempt.
struct CopyResult
{
  std::int64_t transferred{0};
  std::optional<IoResult> error; // Empty when the attempt ended at EOF
};

/// Copy buffer of one direction, plus the slice already read from the source
/// that the destination has not accepted yet. Lives across copy attempts so a
/// write that times out part-way resumes where it stopped.
struct CopyState
{
  explicit CopyState(std::size_t chunkSize) : buffer(chunkSize) {}

  bool hasPending() const { return pendingLength > 0; }

  std::vector<std::uint8_t> buffer;
  std::size_t pendingOffset{0};
  std::size_t pendingLength{0};
};

/// Pump src into dst until src reports EOF or either side fails. A pending
/// slice left by an earlier attempt is written before anything new is read,
/// from the same buffer address. onProgress runs whenever dst accepted bytes.
inline CopyResult copyStream(Stream &src, Stream &dst, CopyState &state,
                             const std::function<void(std::size_t)> &onProgress = nullptr)
{
  CopyResult result;
  while (true)
  {
    if (!state.hasPending())
    {
      std::size_t got = 0;
      IoResult rr = src.read(state.buffer.data(), state.buffer.size(), got);
      if (!rr.ok)
      {
        result.error = std::move(rr);
        return result;
      }
      if (got == 0)
      {
        return result;
      }
      state.pendingOffset = 0;
      state.pendingLength = got;
    }

    std::size_t put = 0;
    IoResult wr =
      dst.write(state.buffer.data() + state.pendingOffset, state.pendingLength, put);
    put = put > state.pendingLength ? state.pendingLength : put;
    state.pendingOffset += put;
    state.pendingLength -= put;
    result.transferred += static_cast<std::int64_t>(put);
    if (put > 0 && onProgress)
    {
      onProgress(put);
    }
    if (!wr.ok)
    {
      result.error = std::move(wr);
      return result;
    }
  }
}

} // namespace network
} // namespace ferry
