// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace ferry::network;

TEST_CASE("CloseHeuristic classifies transport errors", "[network][heuristic]")
{
  REQUIRE(CloseHeuristic::classify(IoResult::success()) == ErrorClass::None);
  REQUIRE(CloseHeuristic::classify(std::optional<IoResult>{}) == ErrorClass::None);
  REQUIRE(CloseHeuristic::classify(IoResult::timeout()) == ErrorClass::Timeout);
  REQUIRE(CloseHeuristic::classify(IoResult::closedStream()) == ErrorClass::ClosedStream);
  REQUIRE(CloseHeuristic::classify(IoResult::failure(TransportError::PeerClosed, "reset")) ==
          ErrorClass::Fatal);
  REQUIRE(CloseHeuristic::classify(IoResult::failure(TransportError::TLSIO, "bad record mac")) ==
          ErrorClass::Fatal);
  REQUIRE(CloseHeuristic::classify(IoResult::failure(TransportError::Socket, "EHOSTUNREACH")) ==
          ErrorClass::Fatal);
}

TEST_CASE("CloseHeuristic threshold for empty reads", "[network][heuristic]")
{
  const std::int64_t k = 10;
  CloseHeuristic heuristic(k);

  SECTION("K-1 empty reads are not a close")
  {
    REQUIRE_FALSE(heuristic.isEffectivelyClosed(std::nullopt, 0, k - 1));
  }

  SECTION("The K-th empty read is a close")
  {
    REQUIRE(heuristic.isEffectivelyClosed(std::nullopt, 0, k));
    REQUIRE(heuristic.isEffectivelyClosed(std::nullopt, 0, k + 5));
  }

  SECTION("Data in the last chunk is never a close")
  {
    REQUIRE_FALSE(heuristic.isEffectivelyClosed(std::nullopt, 1, k));
    REQUIRE_FALSE(heuristic.isEffectivelyClosed(IoResult::closedStream(), 512, k * 2));
  }
}

TEST_CASE("CloseHeuristic threshold for closed-stream errors", "[network][heuristic]")
{
  CloseHeuristic heuristic(3);

  REQUIRE_FALSE(heuristic.isEffectivelyClosed(IoResult::closedStream(), 0, 2));
  REQUIRE(heuristic.isEffectivelyClosed(IoResult::closedStream(), 0, 3));

  // Timeouts and fatal errors are not cycle-counted closes
  REQUIRE_FALSE(heuristic.isEffectivelyClosed(IoResult::timeout(), 0, 100));
  REQUIRE_FALSE(
    heuristic.isEffectivelyClosed(IoResult::failure(TransportError::PeerClosed, "reset"), 0, 100));

  CloseObservation obs;
  obs.lastError = IoResult::closedStream();
  obs.cyclesElapsed = 3;
  REQUIRE(heuristic.evaluate(obs));
  obs.lastChunkSize = 10;
  REQUIRE_FALSE(heuristic.evaluate(obs));
}

TEST_CASE("CloseHeuristic closed candidates", "[network][heuristic]")
{
  REQUIRE(CloseHeuristic::isClosedCandidate(std::nullopt, 0));
  REQUIRE(CloseHeuristic::isClosedCandidate(IoResult::closedStream(), 0));
  REQUIRE_FALSE(CloseHeuristic::isClosedCandidate(std::nullopt, 4));
  REQUIRE_FALSE(CloseHeuristic::isClosedCandidate(IoResult::timeout(), 0));
  REQUIRE_FALSE(
    CloseHeuristic::isClosedCandidate(IoResult::failure(TransportError::Socket, "EIO"), 0));
  REQUIRE(CloseHeuristic().maxClosedCycles() == 10);
}

TEST_CASE("Completion policy table", "[network][policy]")
{
  struct Row
  {
    CompletionPolicy policy;
    bool none, uploadOnly, downloadOnly, both;
  };
  const Row rows[] = {
    {CompletionPolicy::EitherSide, false, true, true, true},
    {CompletionPolicy::BothSides, false, false, false, true},
    {CompletionPolicy::ClientOnly, false, true, false, true},
    {CompletionPolicy::RemoteOnly, false, false, true, true},
  };

  for (const auto &row : rows)
  {
    INFO("policy " << toString(row.policy));
    REQUIRE(isSatisfied(row.policy, false, false) == row.none);
    REQUIRE(isSatisfied(row.policy, true, false) == row.uploadOnly);
    REQUIRE(isSatisfied(row.policy, false, true) == row.downloadOnly);
    REQUIRE(isSatisfied(row.policy, true, true) == row.both);
  }
}
