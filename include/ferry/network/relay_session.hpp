// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <ferry/core/logger.hpp>
#include <ferry/core/thread_pool.hpp>

#include "close_heuristic.hpp"
#include "completion_policy.hpp"
#include "liveness_clock.hpp"
#include "relay_config.hpp"
#include "stream.hpp"
#include "tls_stream.hpp"
#include "transport_types.hpp"

namespace ferry
{
namespace network
{

class RelaySession;

/// Caller hooks for a relay session. All are optional and run on pool
/// threads; exceptions they throw are logged and contained.
struct RelayCallbacks
{
  /// Fired at most once, when the completion policy holds. An unfinished
  /// direction is reported as 0.
  std::function<void(std::int64_t uploaded, std::int64_t downloaded)> onComplete;

  /// Heartbeat probe. Throwing stops further heartbeats.
  std::function<void()> onHeartbeat;

  /// Fired once the reaper has closed the streams and freed TLS state.
  std::function<void(const RelaySession &)> onReaped;
};

/// Bidirectional relay between a client stream and a remote stream.
///
/// perform() starts two directional copiers and, when onHeartbeat is set, the
/// heartbeat emitter as pool tasks. Completion is decided by whichever copier
/// publishes the total that satisfies the policy. Reaping is done by the last
/// task to leave: it closes the streams and frees TLS state once no other
/// task can use them, so a session parks at most three pool threads.
class RelaySession : public std::enable_shared_from_this<RelaySession>
{
public:
  /// Streams should carry a finite read timeout (see SocketStream's
  /// ioTimeout): the idle check runs between reads, so a copier blocked
  /// forever on a silent peer never notices aliveInterval has passed.
  /// \throws std::invalid_argument if pool or either stream is null, or the
  /// config does not validate.
  static std::shared_ptr<RelaySession> create(core::ThreadPool *pool, std::unique_ptr<Stream> client,
                                              std::unique_ptr<Stream> remote,
                                              RelayConfig config = {},
                                              RelayCallbacks callbacks = {},
                                              std::unique_ptr<TlsHandle> clientTls = nullptr,
                                              std::unique_ptr<TlsHandle> remoteTls = nullptr,
                                              std::optional<SessionId> id = std::nullopt)
  {
    if (!pool)
    {
      throw std::invalid_argument("RelaySession requires a thread pool");
    }
    if (!client || !remote)
    {
      throw std::invalid_argument("RelaySession requires both client and remote streams");
    }
    config.validate();
    return std::shared_ptr<RelaySession>(
      new RelaySession(pool, std::move(client), std::move(remote), std::move(config),
                       std::move(callbacks), std::move(clientTls), std::move(remoteTls),
                       id ? *id : nextSessionId()));
  }

  RelaySession(const RelaySession &) = delete;
  RelaySession &operator=(const RelaySession &) = delete;

  ~RelaySession() = default;

  /// Start relaying. Returns immediately; false if already started.
  /// \throws std::runtime_error if the pool rejects a task. Streams are
  /// interrupted first so any task already running unwinds.
  bool perform()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_started)
      {
        return false;
      }
      _started = true;
      // Held by perform() itself until scheduling is over
      _liveTasks = 1;
    }

    FERRY_LOG_INFO("RelaySession[" << _id << "]: starting " << _streams[0]->describe() << " <-> "
                                   << _streams[1]->describe());
    _clock.touch();

    std::vector<std::shared_future<void>> workers;
    workers.reserve(3);
    int copiersScheduled = 0;
    try
    {
      schedule(workers, [](RelaySession &s) { s.runCopier(Side::Client); });
      ++copiersScheduled;
      schedule(workers, [](RelaySession &s) { s.runCopier(Side::Remote); });
      ++copiersScheduled;
      if (_callbacks.onHeartbeat)
      {
        schedule(workers, [](RelaySession &s) { s.runHeartbeat(); });
      }
    }
    catch (const std::exception &e)
    {
      FERRY_LOG_ERROR("RelaySession[" << _id << "]: failed to schedule tasks: " << e.what());
      interruptStreams();
      // A copier that never started still has to publish so completion
      // can be decided.
      if (copiersScheduled < 1)
      {
        publish(Side::Client, 0, IoResult::failure(TransportError::Cancelled, e.what()),
                "not scheduled");
      }
      if (copiersScheduled < 2)
      {
        publish(Side::Remote, 0, IoResult::failure(TransportError::Cancelled, e.what()),
                "not scheduled");
      }
      markSpawned(std::move(workers));
      taskExited();
      throw;
    }
    markSpawned(std::move(workers));
    taskExited();
    return true;
  }

  /// True once every task has terminated and resources are released.
  /// Vacuously true before perform().
  bool finished() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_started)
    {
      return true;
    }
    if (!_spawned || !_reaped)
    {
      return false;
    }
    for (const auto &task : _workers)
    {
      if (task.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
      {
        return false;
      }
    }
    return true;
  }

  /// Block until every task has finished and resources are released. Must
  /// not be called from a task running on the session's pool.
  void join()
  {
    std::vector<std::shared_future<void>> workers;
    {
      std::unique_lock<std::mutex> lock(_mutex);
      if (!_started)
      {
        return;
      }
      _cv.wait(lock, [this]() { return _spawned && _reaped; });
      workers = _workers;
    }
    for (auto &task : workers)
    {
      task.wait();
    }
  }

  /// Tear the session down. With tasks still running this only interrupts
  /// both streams; the last task to exit closes them and frees TLS.
  /// Idempotent, never throws.
  void cleanup()
  {
    if (!finished())
    {
      FERRY_LOG_DEBUG("RelaySession[" << _id << "]: cleanup requested while running, interrupting");
      interruptStreams();
      return;
    }
    releaseSide(Side::Client);
    releaseSide(Side::Remote);
  }

  /// Tear down one side only. TLS state is freed only once every worker task
  /// is gone; until then the side's stream is merely interrupted.
  void cleanup(Side side)
  {
    if (!finished())
    {
      interruptStream(side);
      return;
    }
    releaseSide(side);
  }

  std::optional<std::int64_t> uploadedBytes() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _totals[0];
  }

  std::optional<std::int64_t> downloadedBytes() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _totals[1];
  }

  /// Last error seen by the copier reading from side; empty if it saw none.
  std::optional<IoResult> lastError(Side side) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastErrors[index(side)];
  }

  /// True once the completion callback has fired (or would have, if unset).
  bool completed() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _completed;
  }

  /// True once the reaper has released every resource.
  bool reaped() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _reaped;
  }

  /// Tasks (and a perform() call in progress) still running their work.
  /// Zero by the time resources are released.
  std::size_t runningTasks() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _liveTasks;
  }

  SessionId id() const { return _id; }

  const RelayConfig &config() const { return _config; }

  const LivenessClock &clock() const { return _clock; }

private:
  RelaySession(core::ThreadPool *pool, std::unique_ptr<Stream> client,
               std::unique_ptr<Stream> remote, RelayConfig config, RelayCallbacks callbacks,
               std::unique_ptr<TlsHandle> clientTls, std::unique_ptr<TlsHandle> remoteTls,
               SessionId id)
      : _pool(pool), _config(std::move(config)), _callbacks(std::move(callbacks)), _id(id),
        _heuristic(_config.maxClosedCycles)
  {
    _tls[0] = std::move(clientTls);
    _tls[1] = std::move(remoteTls);
    _streams[0] = std::move(client);
    _streams[1] = std::move(remote);
  }

  static SessionId nextSessionId()
  {
    static std::atomic<SessionId> counter{0};
    return ++counter;
  }

  static std::size_t index(Side side) { return side == Side::Client ? 0 : 1; }

  static Side opposite(Side side) { return side == Side::Client ? Side::Remote : Side::Client; }

  static const char *direction(Side source)
  {
    return source == Side::Client ? "upload" : "download";
  }

  Stream &stream(Side side) { return *_streams[index(side)]; }

  /// Counts the task as live before handing it to the pool; the task leaves
  /// through taskExited() whatever its body does.
  template <typename Body> void schedule(std::vector<std::shared_future<void>> &workers, Body body)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      ++_liveTasks;
    }
    auto self = shared_from_this();
    try
    {
      workers.push_back(_pool
                          ->enqueueWithResult(
                            [self, body]()
                            {
                              TaskExit leave{*self};
                              body(*self);
                            })
                          .share());
    }
    catch (const std::exception &)
    {
      std::lock_guard<std::mutex> lock(_mutex);
      --_liveTasks;
      throw;
    }
  }

  struct TaskExit
  {
    RelaySession &session;
    ~TaskExit() { session.taskExited(); }
  };

  void markSpawned(std::vector<std::shared_future<void>> workers)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _workers = std::move(workers);
      _spawned = true;
    }
    _cv.notify_all();
  }

  /// The last one out releases resources.
  void taskExited()
  {
    bool last = false;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      last = --_liveTasks == 0;
    }
    if (last)
    {
      reap();
    }
  }

  /// Directional copier. source == Client is the upload direction.
  void runCopier(Side source)
  {
    std::int64_t count = 0;
    std::optional<IoResult> lastError;
    const char *reason = "closed";
    try
    {
      Stream &src = stream(source);
      Stream &dst = stream(opposite(source));
      CopyState state(_config.readChunkSize);
      std::int64_t cycles = 0;

      while (true)
      {
        CopyResult attempt = copyStream(src, dst, state, [this](std::size_t) { _clock.touch(); });
        count += attempt.transferred;
        if (attempt.transferred > 0)
        {
          _clock.touch();
          cycles = 0;
        }
        if (attempt.error)
        {
          lastError = attempt.error;
        }
        if (CloseHeuristic::isClosedCandidate(attempt.error, attempt.transferred))
        {
          ++cycles;
        }

        auto idle = _clock.idleFor();
        if (!idle)
        {
          reason = "no liveness recorded";
          break;
        }
        if (*idle > _config.aliveInterval)
        {
          reason = "idle timeout";
          break;
        }
        if (_heuristic.isEffectivelyClosed(attempt.error, attempt.transferred, cycles))
        {
          reason = "closed";
          break;
        }
        if (CloseHeuristic::classify(attempt.error) == ErrorClass::Fatal)
        {
          reason = "error";
          break;
        }

        std::unique_lock<std::mutex> lock(_mutex);
        if (_interrupted && attempt.transferred == 0)
        {
          reason = "interrupted";
          break;
        }
        _cv.wait_for(lock, _config.retryBackoff, [this]() { return _interrupted; });
      }
    }
    catch (const std::exception &e)
    {
      FERRY_LOG_ERROR("RelaySession[" << _id << "]: " << direction(source)
                                      << " copier failed: " << e.what());
      lastError = IoResult::failure(TransportError::Unknown, e.what());
      reason = "exception";
    }

    publish(source, count, std::move(lastError), reason);
  }

  /// Record the final total of one direction and wake the other tasks.
  void publish(Side source, std::int64_t count, std::optional<IoResult> lastError,
               const char *reason)
  {
    std::int64_t extra =
      source == Side::Client ? _config.extraUploadedBytes : _config.extraDownloadedBytes;
    bool first = false;
    bool complete = false;
    std::int64_t uploaded = 0;
    std::int64_t downloaded = 0;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto &total = _totals[index(source)];
      if (total)
      {
        return;
      }
      total = count + extra;
      _lastErrors[index(source)] = lastError;
      first = !_totals[index(opposite(source))];
      if (!_completed &&
          isSatisfied(_config.completionPolicy, _totals[0].has_value(), _totals[1].has_value()))
      {
        _completed = true;
        complete = true;
        uploaded = _totals[0].value_or(0);
        downloaded = _totals[1].value_or(0);
      }
    }
    _cv.notify_all();

    if (lastError && CloseHeuristic::classify(*lastError) == ErrorClass::Fatal)
    {
      FERRY_LOG_WARN("RelaySession[" << _id << "]: " << direction(source) << " stopped on "
                                     << toString(lastError->code) << ": " << lastError->message);
    }
    FERRY_LOG_DEBUG("RelaySession[" << _id << "]: " << direction(source) << " finished ("
                                    << reason << "), bytes=" << count + extra);

    if (complete)
    {
      fireComplete(uploaded, downloaded);
    }
    if (first && _config.interruptOnFirstClose)
    {
      interruptStreams();
    }
  }

  void runHeartbeat()
  {
    if (!_callbacks.onHeartbeat)
    {
      return;
    }
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_totals[0] && !_totals[1])
    {
      lock.unlock();
      try
      {
        _callbacks.onHeartbeat();
      }
      catch (const std::exception &e)
      {
        FERRY_LOG_WARN("RelaySession[" << _id << "]: heartbeat probe failed, stopping heartbeats: "
                                       << e.what());
        return;
      }
      _clock.touch();
      lock.lock();
      _cv.wait_for(lock, _config.heartbeatInterval,
                   [this]() { return _totals[0].has_value() || _totals[1].has_value(); });
    }
  }

  void fireComplete(std::int64_t uploaded, std::int64_t downloaded)
  {
    FERRY_LOG_INFO("RelaySession[" << _id << "]: complete, uploaded=" << uploaded
                                   << " downloaded=" << downloaded);
    if (_callbacks.onComplete)
    {
      try
      {
        _callbacks.onComplete(uploaded, downloaded);
      }
      catch (const std::exception &e)
      {
        FERRY_LOG_WARN("RelaySession[" << _id << "]: completion callback threw: " << e.what());
      }
    }
  }

  /// Runs once, on whichever thread leaves last.
  void reap()
  {
    releaseSide(Side::Client);
    releaseSide(Side::Remote);
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _reaped = true;
    }
    _cv.notify_all();
    FERRY_LOG_DEBUG("RelaySession[" << _id << "]: resources released");

    if (_callbacks.onReaped)
    {
      try
      {
        _callbacks.onReaped(*this);
      }
      catch (const std::exception &e)
      {
        FERRY_LOG_WARN("RelaySession[" << _id << "]: reaped callback threw: " << e.what());
      }
    }
  }

  void interruptStreams()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _interrupted = true;
    }
    _cv.notify_all();
    interruptStream(Side::Client);
    interruptStream(Side::Remote);
  }

  void interruptStream(Side side)
  {
    try
    {
      stream(side).interrupt();
    }
    catch (const std::exception &e)
    {
      FERRY_LOG_WARN("RelaySession[" << _id << "]: interrupting " << toString(side)
                                     << " stream failed: " << e.what());
    }
  }

  /// Close one side's stream, then free its TLS state. Only called once no
  /// worker task can touch either.
  void releaseSide(Side side)
  {
    std::size_t i = index(side);
    try
    {
      _streams[i]->close();
    }
    catch (const std::exception &e)
    {
      FERRY_LOG_WARN("RelaySession[" << _id << "]: closing " << toString(side)
                                     << " stream failed: " << e.what());
    }

    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (!_tls[i] || _tlsFreed[i])
      {
        return;
      }
      _tlsFreed[i] = true;
    }
    try
    {
      _tls[i]->free();
      FERRY_LOG_DEBUG("RelaySession[" << _id << "]: freed " << toString(side) << " TLS state");
    }
    catch (const std::exception &e)
    {
      FERRY_LOG_WARN("RelaySession[" << _id << "]: freeing " << toString(side)
                                     << " TLS state failed: " << e.what());
    }
  }

  core::ThreadPool *_pool;
  const RelayConfig _config;
  const RelayCallbacks _callbacks;
  const SessionId _id;
  const CloseHeuristic _heuristic;
  LivenessClock _clock;

  // Declared before the streams so a TlsStream is destroyed while the SSL
  // object it borrows is still alive.
  std::array<std::unique_ptr<TlsHandle>, 2> _tls;
  std::array<std::unique_ptr<Stream>, 2> _streams;

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::array<std::optional<std::int64_t>, 2> _totals;
  std::array<std::optional<IoResult>, 2> _lastErrors;
  std::array<bool, 2> _tlsFreed{{false, false}};
  bool _started{false};
  bool _spawned{false};
  bool _interrupted{false};
  bool _completed{false};
  bool _reaped{false};
  std::size_t _liveTasks{0};
  std::vector<std::shared_future<void>> _workers;
};

} // namespace network
} // namespace ferry
