// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

namespace ferry
{
namespace network
{

/// Which finished directions make a session "reliably complete".
enum class CompletionPolicy
{
  EitherSide,
  BothSides,
  ClientOnly, // client -> remote (upload) finished
  RemoteOnly  // remote -> client (download) finished
};

inline bool isSatisfied(CompletionPolicy policy, bool uploadedSet, bool downloadedSet)
{
  switch (policy)
  {
  case CompletionPolicy::EitherSide:
    return uploadedSet || downloadedSet;
  case CompletionPolicy::BothSides:
    return uploadedSet && downloadedSet;
  case CompletionPolicy::ClientOnly:
    return uploadedSet;
  case CompletionPolicy::RemoteOnly:
    return downloadedSet;
  }
  return false;
}

inline const char *toString(CompletionPolicy policy)
{
  switch (policy)
  {
  case CompletionPolicy::EitherSide:
    return "either";
  case CompletionPolicy::BothSides:
    return "both";
  case CompletionPolicy::ClientOnly:
    return "client";
  case CompletionPolicy::RemoteOnly:
    return "remote";
  }
  return "unknown";
}

/// Accepts the config spellings "either", "both", "client", "remote" and the
/// enumerator names, case-insensitively.
inline CompletionPolicy parseCompletionPolicy(const std::string &text)
{
  std::string v;
  for (char c : text)
  {
    if (c != '_' && c != '-')
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  if (v == "either" || v == "eitherside")
  {
    return CompletionPolicy::EitherSide;
  }
  if (v == "both" || v == "bothsides")
  {
    return CompletionPolicy::BothSides;
  }
  if (v == "client" || v == "clientonly")
  {
    return CompletionPolicy::ClientOnly;
  }
  if (v == "remote" || v == "remoteonly")
  {
    return CompletionPolicy::RemoteOnly;
  }
  throw std::invalid_argument("Unknown completion policy: " + text);
}

} // namespace network
} // namespace ferry
