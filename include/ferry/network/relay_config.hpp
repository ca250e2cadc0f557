// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <ferry/core/config_loader.hpp>

#include "completion_policy.hpp"

namespace ferry
{
namespace network
{

/// Per-session relay settings. Copied into each session at construction and
/// never modified afterwards.
struct RelayConfig
{
  /// Longest allowed gap since the last observed activity before a copier
  /// gives up, whatever the close heuristic says.
  std::chrono::milliseconds aliveInterval{std::chrono::minutes(1)};

  /// Spacing between heartbeat probes while no direction has finished.
  std::chrono::milliseconds heartbeatInterval{std::chrono::seconds(10)};

  /// Consecutive "probably closed" attempts before a stream counts as dead.
  std::int64_t maxClosedCycles{10};

  /// When onComplete fires.
  CompletionPolicy completionPolicy{CompletionPolicy::BothSides};

  /// Offsets added to the published totals, e.g. handshake bytes already
  /// exchanged before the relay started.
  std::int64_t extraUploadedBytes{0};
  std::int64_t extraDownloadedBytes{0};

  /// Pause between copy attempts.
  std::chrono::milliseconds retryBackoff{50};

  /// Bytes requested per read.
  std::size_t readChunkSize{16 * 1024};

  /// Shut both streams down as soon as either direction finishes, so the
  /// opposite copier unwinds instead of waiting out aliveInterval.
  bool interruptOnFirstClose{true};

  /// \throws std::invalid_argument on a nonsensical combination.
  void validate() const
  {
    if (aliveInterval.count() <= 0)
    {
      throw std::invalid_argument("relay.alive_interval must be positive");
    }
    if (heartbeatInterval.count() < 0 || retryBackoff.count() < 0)
    {
      throw std::invalid_argument("relay intervals must not be negative");
    }
    if (maxClosedCycles < 1)
    {
      throw std::invalid_argument("relay.max_closed_cycles must be at least 1");
    }
    if (readChunkSize == 0)
    {
      throw std::invalid_argument("relay.read_chunk_size must be positive");
    }
  }

  /// Parse "250ms", "10s", "1m" or a bare number of milliseconds.
  static std::chrono::milliseconds parseDuration(const std::string &text)
  {
    std::size_t used = 0;
    long long value = 0;
    try
    {
      value = std::stoll(text, &used);
    }
    catch (const std::logic_error &)
    {
      throw std::invalid_argument("Invalid duration: '" + text + "'");
    }
    if (value < 0)
    {
      throw std::invalid_argument("Negative duration: '" + text + "'");
    }

    std::string unit = text.substr(used);
    if (unit.empty() || unit == "ms")
    {
      return std::chrono::milliseconds(value);
    }
    if (unit == "s")
    {
      return std::chrono::seconds(value);
    }
    if (unit == "m")
    {
      return std::chrono::minutes(value);
    }
    throw std::invalid_argument("Unknown duration unit in '" + text + "'");
  }

  /// Read the [relay] table of a loaded file over the built-in defaults.
  static RelayConfig fromLoader(const core::ConfigLoader &loader);

  /// Overlay values from the [section] table of a loaded file onto base.
  /// Durations may be integers (milliseconds) or unit-suffixed strings.
  static RelayConfig fromLoader(const core::ConfigLoader &loader, RelayConfig base,
                                const std::string &section = "relay")
  {
    auto key = [&section](const char *name) { return section + "." + name; };
    auto duration = [&](const char *name, std::chrono::milliseconds &out)
    {
      if (auto ms = loader.getInt(key(name)))
      {
        if (*ms < 0)
        {
          throw std::invalid_argument(key(name) + " must not be negative");
        }
        out = std::chrono::milliseconds(*ms);
      }
      else if (auto text = loader.getString(key(name)))
      {
        out = parseDuration(*text);
      }
    };

    duration("alive_interval", base.aliveInterval);
    duration("heartbeat_interval", base.heartbeatInterval);
    duration("retry_backoff", base.retryBackoff);

    if (auto v = loader.getInt(key("max_closed_cycles")))
    {
      base.maxClosedCycles = *v;
    }
    if (auto v = loader.getString(key("completion_policy")))
    {
      base.completionPolicy = parseCompletionPolicy(*v);
    }
    if (auto v = loader.getInt(key("extra_uploaded_bytes")))
    {
      base.extraUploadedBytes = *v;
    }
    if (auto v = loader.getInt(key("extra_downloaded_bytes")))
    {
      base.extraDownloadedBytes = *v;
    }
    if (auto v = loader.getInt(key("read_chunk_size")))
    {
      if (*v <= 0)
      {
        throw std::invalid_argument(key("read_chunk_size") + " must be positive");
      }
      base.readChunkSize = static_cast<std::size_t>(*v);
    }
    if (auto v = loader.getBool(key("interrupt_on_first_close")))
    {
      base.interruptOnFirstClose = *v;
    }

    base.validate();
    return base;
  }
};

inline RelayConfig RelayConfig::fromLoader(const core::ConfigLoader &loader)
{
  return fromLoader(loader, RelayConfig());
}

} // namespace network
} // namespace ferry
