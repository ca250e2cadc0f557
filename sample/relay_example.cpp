/// \file relay_example.cpp
/// \brief Plain TCP port forwarder built on RelayService.
///
/// Usage: ferry_relay_example <listen-port> <upstream-host> <upstream-port>
///        [config.toml]
///
/// Every accepted connection is paired with a fresh connection to the
/// upstream and handed to a RelaySession. The sample shows how to:
///
/// - Initialise the `RelayService` singleton, optionally from a TOML file
///   with `[log]`, `[thread_pool]` and `[relay]` tables.
/// - Wrap connected sockets in `SocketStream` and start a session.
/// - Observe completion through `RelayCallbacks`.
/// - Report aggregate statistics on shutdown (SIGINT / SIGTERM).

#include "ferry/ferry.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace
{

std::atomic<bool> g_stop{false};

void onSignal(int) { g_stop = true; }

int listenOn(std::uint16_t port)
{
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0)
  {
    throw std::runtime_error(std::string("socket: ") + std::strerror(errno));
  }
  int yes = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 || ::listen(fd, 64) != 0)
  {
    int err = errno;
    ::close(fd);
    throw std::runtime_error("bind/listen on port " + std::to_string(port) + ": " +
                             std::strerror(err));
  }
  return fd;
}

/// Returns a connected socket, or -1 with the reason logged.
int connectTo(const std::string &host, const std::string &port)
{
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0)
  {
    FERRY_LOG_ERROR("resolve " << host << ":" << port << " failed: " << ::gai_strerror(rc));
    return -1;
  }

  int fd = -1;
  for (addrinfo *ai = res; ai; ai = ai->ai_next)
  {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0)
    {
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
    {
      break;
    }
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);

  if (fd < 0)
  {
    FERRY_LOG_ERROR("connect " << host << ":" << port << " failed: " << std::strerror(errno));
  }
  return fd;
}

} // namespace

int main(int argc, char **argv)
{
  if (argc < 4)
  {
    std::cerr << "usage: " << argv[0]
              << " <listen-port> <upstream-host> <upstream-port> [config.toml]" << std::endl;
    return EXIT_FAILURE;
  }

  ferry::RelayService::Config config;
  if (argc > 4)
  {
    config.configFile = argv[4];
  }

  int listenFd = -1;
  try
  {
    ferry::RelayService::init(config);
    listenFd = listenOn(static_cast<std::uint16_t>(std::stoi(argv[1])));
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    ferry::RelayService::shutdown();
    return EXIT_FAILURE;
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  auto svc = ferry::RelayService::instance();
  const std::string upstreamHost = argv[2];
  const std::string upstreamPort = argv[3];
  const auto ioTimeout = std::chrono::milliseconds(1000);
  FERRY_LOG_INFO("relay_example: forwarding port " << argv[1] << " to " << upstreamHost << ":"
                                                   << upstreamPort);

  while (!g_stop)
  {
    pollfd pfd{listenFd, POLLIN, 0};
    if (::poll(&pfd, 1, 200) <= 0)
    {
      continue;
    }
    int clientFd = ::accept(listenFd, nullptr, nullptr);
    if (clientFd < 0)
    {
      FERRY_LOG_WARN("accept failed: " << std::strerror(errno));
      continue;
    }
    int remoteFd = connectTo(upstreamHost, upstreamPort);
    if (remoteFd < 0)
    {
      ::close(clientFd);
      continue;
    }

    ferry::network::RelayCallbacks callbacks;
    callbacks.onComplete = [](std::int64_t up, std::int64_t down)
    { FERRY_LOG_INFO("relay_example: connection done, up=" << up << " down=" << down); };

    try
    {
      auto session = svc->createSession(
        std::make_unique<ferry::network::SocketStream>(clientFd, ioTimeout),
        std::make_unique<ferry::network::SocketStream>(remoteFd, ioTimeout), std::move(callbacks));
      session->perform();
    }
    catch (const std::exception &e)
    {
      FERRY_LOG_ERROR("relay_example: could not start session: " << e.what());
    }
  }

  auto stats = svc->stats();
  FERRY_LOG_INFO("relay_example: sessions=" << stats.sessionsStarted
                                            << " uploaded=" << stats.bytesUploaded
                                            << " downloaded=" << stats.bytesDownloaded);
  ::close(listenFd);
  ferry::RelayService::shutdown();
  return EXIT_SUCCESS;
}
