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
using ferry::test::ScriptedStream;
using ferry::test::SocketPair;

namespace
{
IoResult readSome(Stream &stream, std::string &out, std::size_t max = 1024)
{
  std::vector<std::uint8_t> buf(max);
  std::size_t got = 0;
  IoResult r = stream.read(buf.data(), buf.size(), got);
  out.assign(reinterpret_cast<const char *>(buf.data()), got);
  return r;
}
} // namespace

TEST_CASE("SocketStream reads and writes", "[network][socket]")
{
  SocketPair pair;
  SocketStream stream(pair.release(0));

  REQUIRE(ferry::test::writeAll(pair.second(), "ping"));
  std::string got;
  REQUIRE(readSome(stream, got).ok);
  REQUIRE(got == "ping");

  const std::string reply = "pong";
  std::size_t written = 0;
  REQUIRE(stream.write(reinterpret_cast<const std::uint8_t *>(reply.data()), reply.size(), written)
            .ok);
  REQUIRE(written == reply.size());
  REQUIRE(ferry::test::readUpTo(pair.second(), 4) == "pong");
}

TEST_CASE("SocketStream maps outcomes to IoResult", "[network][socket]")
{
  SocketPair pair;
  SocketStream stream(pair.release(0), std::chrono::milliseconds(50));
  std::string got;

  SECTION("Receive timeout is a Timeout")
  {
    IoResult r = readSome(stream, got);
    REQUIRE_FALSE(r.ok);
    REQUIRE(r.code == TransportError::Timeout);
    REQUIRE(CloseHeuristic::classify(r) == ErrorClass::Timeout);
  }

  SECTION("Peer close is EOF")
  {
    ::close(pair.release(1));
    IoResult r = readSome(stream, got);
    REQUIRE(r.ok);
    REQUIRE(got.empty());
  }

  SECTION("Writing to a vanished peer is fatal")
  {
    ::close(pair.release(1));
    const std::string data(64 * 1024, 'x');
    IoResult r = IoResult::success();
    for (int i = 0; i < 8 && r.ok; ++i)
    {
      std::size_t written = 0;
      r = stream.write(reinterpret_cast<const std::uint8_t *>(data.data()), data.size(), written);
    }
    REQUIRE_FALSE(r.ok);
    REQUIRE(CloseHeuristic::classify(r) == ErrorClass::Fatal);
  }

  SECTION("Operations after close report a closed stream")
  {
    stream.close();
    stream.close();
    REQUIRE(stream.isClosed());
    IoResult r = readSome(stream, got);
    REQUIRE(r.code == TransportError::StreamClosed);
    REQUIRE(r.message == "Closed stream");
  }
}

TEST_CASE("SocketStream interrupt wakes a blocked reader", "[network][socket]")
{
  SocketPair pair;
  SocketStream stream(pair.release(0));

  std::atomic<bool> done{false};
  IoResult result = IoResult::timeout();
  std::string got = "unset";
  std::thread reader(
    [&]()
    {
      result = readSome(stream, got);
      done = true;
    });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE_FALSE(done.load());
  stream.interrupt();
  REQUIRE(ferry::test::waitFor([&]() { return done.load(); }));
  reader.join();

  REQUIRE(result.ok);
  REQUIRE(got.empty());
  REQUIRE(stream.isInterrupted());
  REQUIRE_FALSE(stream.isClosed());
}

TEST_CASE("copyStream pumps until EOF", "[network][copy]")
{
  ScriptedStream src("src");
  src.then(ScriptedStream::chunk("hello "))
    .then(ScriptedStream::chunk("world"))
    .then(ScriptedStream::eof());
  ScriptedStream dst("dst");

  CopyState state(4096);
  std::size_t progressCalls = 0;
  CopyResult r = copyStream(src, dst, state, [&](std::size_t) { ++progressCalls; });

  REQUIRE(r.transferred == 11);
  REQUIRE_FALSE(r.error.has_value());
  REQUIRE(dst.written() == "hello world");
  REQUIRE(progressCalls == 2);
}

TEST_CASE("copyStream reports the first error with the bytes moved so far", "[network][copy]")
{
  ScriptedStream src("src");
  src.then(ScriptedStream::chunk("abc")).then(ScriptedStream::timeout());
  ScriptedStream dst("dst");

  CopyState state(4096);
  CopyResult r = copyStream(src, dst, state);

  REQUIRE(r.transferred == 3);
  REQUIRE(r.error.has_value());
  REQUIRE(r.error->code == TransportError::Timeout);

  dst.close();
  src.then(ScriptedStream::chunk("more"));
  CopyResult r2 = copyStream(src, dst, state);
  REQUIRE(r2.transferred == 0);
  REQUIRE(r2.error->code == TransportError::StreamClosed);
  REQUIRE(state.pendingLength == 4);
}

TEST_CASE("copyStream resumes a write that timed out part-way", "[network][copy]")
{
  ScriptedStream src("src");
  src.then(ScriptedStream::chunk("ABCDEFGHIJ")).then(ScriptedStream::chunk("KLMN"));
  ScriptedStream dst("dst");
  dst.stallNextWriteAfter(4);

  CopyState state(4096);
  CopyResult first = copyStream(src, dst, state);
  REQUIRE(first.transferred == 4);
  REQUIRE(first.error->code == TransportError::Timeout);
  REQUIRE(state.hasPending());
  REQUIRE(state.pendingOffset == 4);
  REQUIRE(state.pendingLength == 6);
  REQUIRE(src.reads() == 1);

  CopyResult second = copyStream(src, dst, state);
  REQUIRE(second.transferred == 10);
  REQUIRE_FALSE(second.error.has_value());
  REQUIRE_FALSE(state.hasPending());
  REQUIRE(dst.written() == "ABCDEFGHIJKLMN");
}
