// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include <ferry/core/logger.hpp>

namespace ferry
{
namespace core
{

/// A dynamic thread pool that accepts void or result-returning callables with
/// arbitrary arguments. Threads grow on demand up to maxSize and threads
/// beyond initialSize retire after idleTimeout. Relay tasks block on I/O for
/// their whole lifetime, so the pool grows a thread per queued task instead of
/// waiting for a busy worker to free up.
class ThreadPool
{
public:
  /// Constructs the thread pool.
  ///
  /// @param initialSize   Minimum number of threads (always maintained).
  /// @param maxSize       Maximum number of threads (hard limit).
  /// @param idleTimeout   Duration after which idle threads beyond the
  /// initial count exit.
  /// @param maxQueueSize  Maximum number of queued tasks before enqueue
  /// throws.
  /// @param onTaskError   Optional handler for uncaught exceptions in
  /// fire-and-forget tasks.
  ThreadPool(std::size_t initialSize = 2,
             std::size_t maxSize = std::thread::hardware_concurrency() * 16,
             std::chrono::milliseconds idleTimeout = std::chrono::seconds(30),
             std::size_t maxQueueSize = 1024,
             std::function<void(std::exception_ptr)> onTaskError = nullptr)
      : _initialSize(initialSize), _maxSize(maxSize < 1 ? 1 : maxSize),
        _idleTimeout(idleTimeout), _maxQueueSize(maxQueueSize),
        _onTaskError(std::move(onTaskError))
  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (std::size_t i = 0; i < _initialSize && i < _maxSize; ++i)
    {
      spawnWorkerLocked();
    }
  }

  ~ThreadPool() { shutdown(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  /// Enqueue a fire-and-forget task. Exceptions it throws are forwarded to
  /// the onTaskError handler, or logged when there is none.
  template <typename F, typename... Args> void enqueue(F &&func, Args &&...args)
  {
    auto bound = std::bind(std::forward<F>(func), std::forward<Args>(args)...);
    enqueueImpl(
      [bound = std::move(bound), this]() mutable
      {
        try
        {
          bound();
        }
        catch (...)
        {
          reportTaskError(std::current_exception());
        }
      });
  }

  /// Enqueue a task and get a future for its result. Exceptions are stored
  /// in the future. The future doubles as the task's completion handle.
  template <typename F, typename... Args>
  auto enqueueWithResult(F &&func, Args &&...args) -> std::future<std::invoke_result_t<F, Args...>>
  {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
      std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    auto future = task->get_future();
    enqueueImpl([task]() { (*task)(); });
    return future;
  }

  /// Like enqueue() but returns false instead of throwing when the task is
  /// rejected.
  template <typename F> bool tryEnqueue(F &&func)
  {
    try
    {
      enqueue(std::forward<F>(func));
      return true;
    }
    catch (const std::runtime_error &e)
    {
      FERRY_LOG_DEBUG("ThreadPool::tryEnqueue rejected task: " << e.what());
      return false;
    }
  }

  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
  }

  /// Number of threads currently executing a task.
  std::size_t getActiveThreadCount() const { return _busyThreads.load(); }

  /// Number of live worker threads.
  std::size_t getTotalThreadCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _liveThreads;
  }

  bool isShutdown() const { return _shutdown.load(); }

  /// Stop accepting tasks, run what is queued, and join every worker.
  /// Must not be called from a pool thread.
  void shutdown()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        return;
      }
      _shutdown = true;
    }
    _condition.notify_all();
    FERRY_LOG_DEBUG("ThreadPool::shutdown() - waiting for workers");

    std::unordered_map<std::thread::id, std::thread> threads;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      threads.swap(_threads);
      _retired.clear();
    }

    int joined = 0;
    for (auto &entry : threads)
    {
      if (entry.second.joinable())
      {
        entry.second.join();
        ++joined;
      }
    }
    FERRY_LOG_DEBUG("ThreadPool::shutdown() - " << joined << " threads joined");
  }

private:
  void enqueueImpl(std::function<void()> f)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        throw std::runtime_error("ThreadPool is shutting down");
      }
      if (_tasks.size() >= _maxQueueSize)
      {
        throw std::runtime_error("ThreadPool task queue is full");
      }

      _tasks.emplace(std::move(f));

      reapRetiredLocked();
      std::size_t idle = _liveThreads - _busyThreads.load();
      if (idle < _tasks.size() && _liveThreads < _maxSize)
      {
        spawnWorkerLocked();
      }
    }
    _condition.notify_one();
  }

  void reportTaskError(std::exception_ptr error)
  {
    std::function<void(std::exception_ptr)> handler;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      handler = _onTaskError;
    }

    if (handler)
    {
      handler(error);
      return;
    }
    try
    {
      std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
      FERRY_LOG_ERROR("ThreadPool: unhandled exception in task: " << e.what());
    }
    catch (...)
    {
      FERRY_LOG_ERROR("ThreadPool: unhandled non-standard exception in task");
    }
  }

  /// Join threads that retired on idle timeout. Caller holds _mutex and is
  /// never one of the retired threads, since it is still running.
  void reapRetiredLocked()
  {
    for (const auto &id : _retired)
    {
      auto it = _threads.find(id);
      if (it != _threads.end())
      {
        if (it->second.joinable())
        {
          it->second.join();
        }
        _threads.erase(it);
      }
    }
    _retired.clear();
  }

  /// Caller holds _mutex.
  void spawnWorkerLocked()
  {
    ++_liveThreads;
    std::thread t([this]() { workerLoop(); });
    auto id = t.get_id();
    _threads.emplace(id, std::move(t));
  }

  void workerLoop()
  {
    std::unique_lock<std::mutex> lock(_mutex);
    while (true)
    {
      bool woke = _condition.wait_for(lock, _idleTimeout,
                                      [this]() { return _shutdown || !_tasks.empty(); });
      if (!woke)
      {
        if (_liveThreads > _initialSize)
        {
          --_liveThreads;
          _retired.push_back(std::this_thread::get_id());
          return;
        }
        continue;
      }

      if (_tasks.empty())
      {
        // Shutdown with nothing left to run
        --_liveThreads;
        return;
      }

      std::function<void()> task = std::move(_tasks.front());
      _tasks.pop();
      ++_busyThreads;
      lock.unlock();

      task();
      // Release captured state before the task counts as done
      task = nullptr;

      lock.lock();
      --_busyThreads;
    }
  }

private:
  std::unordered_map<std::thread::id, std::thread> _threads;
  std::vector<std::thread::id> _retired;
  std::queue<std::function<void()>> _tasks;
  mutable std::mutex _mutex;
  std::condition_variable _condition;

  const std::size_t _initialSize;
  const std::size_t _maxSize;
  const std::chrono::milliseconds _idleTimeout;
  const std::size_t _maxQueueSize;

  std::atomic<bool> _shutdown{false};
  std::size_t _liveThreads{0};
  std::atomic<std::size_t> _busyThreads{0};

  std::function<void(std::exception_ptr)> _onTaskError;
};

} // namespace core
} // namespace ferry
