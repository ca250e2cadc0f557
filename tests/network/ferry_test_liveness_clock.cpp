// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>
#include <vector>

using namespace ferry::network;
using namespace std::chrono_literals;

TEST_CASE("LivenessClock starts untouched", "[network][liveness]")
{
  LivenessClock clock;
  REQUIRE_FALSE(clock.lastAlive().has_value());
  REQUIRE_FALSE(clock.idleFor().has_value());
  REQUIRE(clock.isExpired(std::chrono::hours(1)));
  REQUIRE(clock.touches() == 0);
}

TEST_CASE("LivenessClock idle time and expiry", "[network][liveness]")
{
  LivenessClock clock;
  auto t0 = MonoClock::now();
  clock.touchAt(t0);

  REQUIRE(clock.idleFor(t0 + 250ms).value() == 250ms);
  REQUIRE_FALSE(clock.isExpired(1s, t0 + 1s));
  REQUIRE(clock.isExpired(1s, t0 + 1001ms));
}

TEST_CASE("LivenessClock never moves backwards", "[network][liveness]")
{
  LivenessClock clock;
  auto t0 = MonoClock::now();
  clock.touchAt(t0 + 5s);
  clock.touchAt(t0);

  REQUIRE(clock.lastAlive().value() == t0 + 5s);
  REQUIRE(clock.touches() == 2);
}

TEST_CASE("LivenessClock concurrent touches", "[network][liveness]")
{
  LivenessClock clock;
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i)
  {
    threads.emplace_back(
      [&clock]()
      {
        for (int j = 0; j < 1000; ++j)
        {
          clock.touch();
          (void)clock.idleFor();
        }
      });
  }
  for (auto &t : threads)
  {
    t.join();
  }

  REQUIRE(clock.touches() == 4000);
  REQUIRE(clock.idleFor().value() < 5s);
}
