// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "core/thread_pool.hpp"
#include "network/close_heuristic.hpp"
#include "network/completion_policy.hpp"
#include "network/liveness_clock.hpp"
#include "network/relay_config.hpp"
#include "network/relay_session.hpp"
#include "network/socket_stream.hpp"
#include "network/stream.hpp"
#include "network/tls_stream.hpp"
#include "network/transport_types.hpp"
#include <atomic>
#include <cctype>
#include <iostream>
#include <iterator>
#include <map>
#include <thread>

namespace ferry
{

/// \brief Process-wide entry point: owns the logger setup, the worker pool
/// every relay session runs on, the default relay settings and aggregate
/// statistics.
class RelayService
{
public:
  RelayService(const RelayService &) = delete;
  RelayService &operator=(const RelayService &) = delete;

  ~RelayService()
  {
    try
    {
      stopSessions();
    }
    catch (const std::exception &e)
    {
      std::cerr << "RelayService destructor error: " << e.what() << std::endl;
    }
  }

  /// \brief Nested configuration mirroring the TOML layout. Unset fields
  /// fall back to the config file, then to built-in defaults.
  struct Config
  {
    struct LogConfig
    {
      std::optional<std::string> level;
      std::optional<std::string> file;
      std::optional<bool> async;
      std::optional<int> retentionDays;
      std::optional<std::string> timeFormat;
    } log;
    struct ThreadPoolConfig
    {
      std::optional<std::size_t> minThreads;
      std::optional<std::size_t> maxThreads;
      std::optional<std::size_t> queueSize;
      std::optional<std::chrono::seconds> idleTimeout;
    } threadPool;
    std::optional<network::RelayConfig> relay;
    std::optional<std::string> configFile;
  };

  /// \brief Aggregate counters across every session this service created.
  struct Stats
  {
    std::uint64_t sessionsStarted{0};
    std::uint64_t sessionsCompleted{0};
    std::uint64_t sessionsReaped{0};
    std::int64_t bytesUploaded{0};
    std::int64_t bytesDownloaded{0};
  };

  static std::shared_ptr<RelayService> instance()
  {
    std::lock_guard<std::mutex> lock(instanceMutex());
    auto &ptr = instanceSlot();
    if (!ptr)
    {
      ptr = std::shared_ptr<RelayService>(new RelayService());
    }
    return ptr;
  }

  /// \brief (Re)initialise the singleton. A running instance is shut down
  /// first.
  /// \throws std::invalid_argument on invalid relay settings,
  /// std::runtime_error if configFile cannot be loaded.
  static void init(const Config &config)
  {
    shutdown();
    auto svc = instance();
    svc->_config = config;
    svc->applyConfig();
  }

  /// \brief Stop every session, join the pool and flush the logger.
  static void shutdown()
  {
    std::shared_ptr<RelayService> svc;
    {
      std::lock_guard<std::mutex> lock(instanceMutex());
      svc = instanceSlot();
      instanceSlot().reset();
    }
    if (!svc || !svc->_running.exchange(false))
    {
      return;
    }
    try
    {
      FERRY_LOG_INFO("RelayService: shutting down, active sessions=" << svc->activeSessions());
      svc->stopSessions();
      svc->_threadPool.reset();
      core::Logger::shutdown();
    }
    catch (const std::exception &e)
    {
      std::cerr << "RelayService shutdown error: " << e.what() << std::endl;
    }
  }

  /// \brief Fill unset fields of config from a loaded TOML file. Values the
  /// caller already set win.
  static void mergeConfigFile(Config &config, const core::ConfigLoader &loader)
  {
    if (!config.log.level)
    {
      config.log.level = loader.getString("log.level");
    }
    if (!config.log.file)
    {
      config.log.file = loader.getString("log.file");
    }
    if (!config.log.async)
    {
      config.log.async = loader.getBool("log.async");
    }
    if (!config.log.retentionDays)
    {
      if (auto v = loader.getInt("log.retention_days"))
      {
        config.log.retentionDays = static_cast<int>(*v);
      }
    }
    if (!config.log.timeFormat)
    {
      config.log.timeFormat = loader.getString("log.time_format");
    }

    auto count = [&loader](const char *key, std::optional<std::size_t> &out)
    {
      if (out)
      {
        return;
      }
      if (auto v = loader.getInt(key))
      {
        if (*v < 0)
        {
          throw std::invalid_argument(std::string(key) + " must not be negative");
        }
        out = static_cast<std::size_t>(*v);
      }
    };
    count("thread_pool.min_threads", config.threadPool.minThreads);
    count("thread_pool.max_threads", config.threadPool.maxThreads);
    count("thread_pool.queue_size", config.threadPool.queueSize);
    if (!config.threadPool.idleTimeout)
    {
      if (auto v = loader.getInt("thread_pool.idle_timeout_seconds"))
      {
        config.threadPool.idleTimeout = std::chrono::seconds(*v);
      }
    }

    if (!config.relay)
    {
      config.relay = network::RelayConfig::fromLoader(loader);
    }
  }

  /// \brief Build a session on the service pool with the service's relay
  /// defaults (or the given override). The session is not started; call
  /// perform() on it.
  /// \throws std::runtime_error if the service is not running.
  std::shared_ptr<network::RelaySession>
  createSession(std::unique_ptr<network::Stream> client, std::unique_ptr<network::Stream> remote,
                network::RelayCallbacks callbacks = {},
                std::unique_ptr<network::TlsHandle> clientTls = nullptr,
                std::unique_ptr<network::TlsHandle> remoteTls = nullptr,
                std::optional<network::RelayConfig> relayOverride = std::nullopt)
  {
    if (!_running.load() || !_threadPool)
    {
      throw std::runtime_error("RelayService is not running");
    }

    auto onComplete = std::move(callbacks.onComplete);
    callbacks.onComplete = [this, onComplete](std::int64_t up, std::int64_t down)
    {
      {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_stats.sessionsCompleted;
      }
      if (onComplete)
      {
        onComplete(up, down);
      }
    };
    auto onReaped = std::move(callbacks.onReaped);
    callbacks.onReaped = [this, onReaped](const network::RelaySession &session)
    {
      {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_stats.sessionsReaped;
        _stats.bytesUploaded += session.uploadedBytes().value_or(0);
        _stats.bytesDownloaded += session.downloadedBytes().value_or(0);
        _sessions.erase(session.id());
      }
      if (onReaped)
      {
        onReaped(session);
      }
    };

    auto session = network::RelaySession::create(
      _threadPool.get(), std::move(client), std::move(remote), relayOverride.value_or(_relayConfig),
      std::move(callbacks), std::move(clientTls), std::move(remoteTls),
      _nextSessionId.fetch_add(1) + 1);

    std::lock_guard<std::mutex> lock(_mutex);
    for (auto it = _sessions.begin(); it != _sessions.end();)
    {
      it = it->second.expired() ? _sessions.erase(it) : std::next(it);
    }
    _sessions[session->id()] = session;
    ++_stats.sessionsStarted;
    FERRY_LOG_DEBUG("RelayService: created session " << session->id());
    return session;
  }

  /// \brief Sessions created by this service that have not been reaped yet.
  std::size_t activeSessions() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::size_t count = 0;
    for (const auto &entry : _sessions)
    {
      if (!entry.second.expired())
      {
        ++count;
      }
    }
    return count;
  }

  Stats stats() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _stats;
  }

  bool isRunning() const { return _running.load(); }

  const network::RelayConfig &relayConfig() const { return _relayConfig; }

  core::ThreadPool *threadPool() const { return _threadPool.get(); }

  const std::unique_ptr<core::ConfigLoader> &configLoader() const { return _configLoader; }

private:
  RelayService() = default;

  static std::mutex &instanceMutex()
  {
    static std::mutex m;
    return m;
  }

  static std::shared_ptr<RelayService> &instanceSlot()
  {
    static std::shared_ptr<RelayService> ptr;
    return ptr;
  }

  static core::Logger::Level toLevel(const std::string &s)
  {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "trace")
    {
      return core::Logger::Level::Trace;
    }
    if (v == "debug")
    {
      return core::Logger::Level::Debug;
    }
    if (v == "warn" || v == "warning")
    {
      return core::Logger::Level::Warning;
    }
    if (v == "error")
    {
      return core::Logger::Level::Error;
    }
    if (v == "fatal")
    {
      return core::Logger::Level::Fatal;
    }
    return core::Logger::Level::Info;
  }

  /// \brief Applies the merged configuration in _config to the service.
  void applyConfig()
  {
    if (_config.configFile)
    {
      _configLoader = std::make_unique<core::ConfigLoader>(*_config.configFile);
      mergeConfigFile(_config, *_configLoader);
    }

    // Logger: must be initialized first
    core::Logger::init(toLevel(_config.log.level.value_or("info")), _config.log.file.value_or(""),
                       _config.log.async.value_or(false), _config.log.retentionDays.value_or(7),
                       _config.log.timeFormat.value_or("%Y-%m-%d %H:%M:%S"));
    FERRY_LOG_INFO("applyConfig: log.level = " << _config.log.level.value_or("<unset>"));
    FERRY_LOG_INFO("applyConfig: log.file = " << _config.log.file.value_or("<unset>"));
    FERRY_LOG_INFO("applyConfig: configFile = " << _config.configFile.value_or("<unset>"));

    _relayConfig = _config.relay.value_or(network::RelayConfig{});
    _relayConfig.validate();
    FERRY_LOG_INFO("applyConfig: relay.alive_interval = " << _relayConfig.aliveInterval.count()
                                                          << "ms");
    FERRY_LOG_INFO("applyConfig: relay.heartbeat_interval = "
                   << _relayConfig.heartbeatInterval.count() << "ms");
    FERRY_LOG_INFO("applyConfig: relay.max_closed_cycles = " << _relayConfig.maxClosedCycles);
    FERRY_LOG_INFO("applyConfig: relay.completion_policy = "
                   << network::toString(_relayConfig.completionPolicy));

    // Each running session parks up to three pool threads.
    std::size_t hw = std::thread::hardware_concurrency() > 0 ? std::thread::hardware_concurrency() : 4;
    std::size_t minThreads = _config.threadPool.minThreads.value_or(2);
    std::size_t maxThreads = _config.threadPool.maxThreads.value_or(hw * 16);
    std::size_t queueSize = _config.threadPool.queueSize.value_or(maxThreads * 2);
    std::chrono::seconds idleTimeout =
      _config.threadPool.idleTimeout.value_or(std::chrono::seconds(60));
    _threadPool = std::make_unique<core::ThreadPool>(
      minThreads, maxThreads, idleTimeout, queueSize,
      [](std::exception_ptr error)
      {
        try
        {
          std::rethrow_exception(error);
        }
        catch (const std::exception &e)
        {
          FERRY_LOG_ERROR("RelayService: pool task failed: " << e.what());
        }
      });
    FERRY_LOG_INFO("applyConfig: thread pool min=" << minThreads << " max=" << maxThreads
                                                   << " queue=" << queueSize);

    _running = true;
  }

  /// \brief Interrupt every live session and wait for its reaper.
  void stopSessions()
  {
    std::vector<std::shared_ptr<network::RelaySession>> live;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      for (auto &entry : _sessions)
      {
        if (auto session = entry.second.lock())
        {
          live.push_back(std::move(session));
        }
      }
    }
    for (auto &session : live)
    {
      session->cleanup();
    }
    for (auto &session : live)
    {
      session->join();
      session->cleanup();
    }
  }

  Config _config;
  network::RelayConfig _relayConfig;
  std::unique_ptr<core::ConfigLoader> _configLoader;
  std::unique_ptr<core::ThreadPool> _threadPool;
  std::atomic<bool> _running{false};
  std::atomic<network::SessionId> _nextSessionId{0};

  mutable std::mutex _mutex;
  std::map<network::SessionId, std::weak_ptr<network::RelaySession>> _sessions;
  Stats _stats;
};

} // namespace ferry
