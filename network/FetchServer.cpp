#include "FetchServer.h"
#include "TcpConnection.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace hr {
namespace network {

namespace {

constexpr int POLL_TIMEOUT_MS = 10;
constexpr std::chrono::milliseconds RESPONSE_TIMEOUT{ 5000 };

IpEndpoint peerOf(int fd) {
  IpEndpoint peer;
  struct sockaddr_in peerAddr;
  socklen_t addrLen = sizeof(peerAddr);
  if (getpeername(fd, (struct sockaddr *)&peerAddr, &addrLen) == 0 &&
      peerAddr.sin_family == AF_INET) {
    char addrStr[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &peerAddr.sin_addr, addrStr, INET_ADDRSTRLEN);
    peer.address = addrStr;
    peer.port = ntohs(peerAddr.sin_port);
  }
  return peer;
}

} // namespace

FetchServer::FetchServer() : Service("network.fetch_server") {}

FetchServer::~FetchServer() { stop(); }

Service::Roe<void> FetchServer::start(const Config &config) {
  config_ = config;
  log().info << "Starting server on " << config_.endpoint;
  return Service::start();
}

Service::Roe<void> FetchServer::onStart() {
  epollFd_ = epoll_create1(0);
  if (epollFd_ < 0) {
    return Service::Error(E_START, "Failed to create epoll: " +
                                       std::string(std::strerror(errno)));
  }

  auto listenResult = server_.listen(config_.endpoint);
  if (!listenResult) {
    ::close(epollFd_);
    epollFd_ = -1;
    return Service::Error(E_START, "Failed to start listening: " +
                                       listenResult.error().message);
  }
  log().info << "Listening on " << server_.getEndpoint();
  return {};
}

void FetchServer::onStop() {
  server_.stop();
  for (auto &[fd, conn] : activeConnections_) {
    ::close(fd);
  }
  activeConnections_.clear();
  {
    std::lock_guard<std::mutex> lock(awaitingMutex_);
    for (int fd : awaitingResponse_) {
      ::close(fd);
    }
    awaitingResponse_.clear();
  }
  if (epollFd_ >= 0) {
    ::close(epollFd_);
    epollFd_ = -1;
  }
}

FetchServer::Roe<void> FetchServer::addResponse(int fd,
                                                const std::string &response) {
  {
    std::lock_guard<std::mutex> lock(awaitingMutex_);
    if (awaitingResponse_.erase(fd) == 0) {
      return Error(1, "No request pending on fd " + std::to_string(fd));
    }
  }

  // Back to blocking mode for the write; the connection owns the fd now
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
  }
  TcpConnection connection(fd);
  auto timeoutResult = connection.setTimeout(RESPONSE_TIMEOUT);
  if (!timeoutResult) {
    return Error(2, timeoutResult.error().message);
  }
  auto sent = connection.sendAndShutdown(response);
  if (!sent) {
    return Error(3, "Failed to send response: " + sent.error().message);
  }
  log().debug << "Response sent (" << *sent << " bytes, fd=" << fd << ")";
  return {};
}

void FetchServer::dropConnection(int fd) {
  epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
  ::close(fd);
  activeConnections_.erase(fd);
}

void FetchServer::acceptConnections() {
  while (true) {
    auto acceptResult = server_.accept();
    if (!acceptResult) {
      return;
    }
    int clientFd = *acceptResult;
    IpEndpoint peer = peerOf(clientFd);

    struct epoll_event ev = {};
    ev.events = EPOLLIN;
    ev.data.fd = clientFd;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, clientFd, &ev) < 0) {
      log().error << "Failed to add fd to epoll: " << std::strerror(errno);
      ::close(clientFd);
      continue;
    }

    ActiveConnection conn;
    conn.fd = clientFd;
    conn.endpoint = peer;
    activeConnections_[clientFd] = std::move(conn);
    log().debug << "Accepted connection from " << peer << " (fd=" << clientFd
                << ")";
  }
}

void FetchServer::readFromConnection(ActiveConnection &conn) {
  char buffer[8192];

  while (true) {
    ssize_t bytesRead = ::recv(conn.fd, buffer, sizeof(buffer), 0);
    if (bytesRead > 0) {
      conn.buffer.append(buffer, static_cast<size_t>(bytesRead));
      if (conn.buffer.size() > config_.maxRequestBytes) {
        log().warning << "Request from " << conn.endpoint << " exceeds "
                      << config_.maxRequestBytes << " bytes, dropped";
        dropConnection(conn.fd);
        return;
      }
      continue;
    }

    if (bytesRead == 0) {
      int fd = conn.fd;
      std::string request = std::move(conn.buffer);
      IpEndpoint peer = conn.endpoint;
      epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
      activeConnections_.erase(fd);
      {
        std::lock_guard<std::mutex> lock(awaitingMutex_);
        awaitingResponse_.insert(fd);
      }
      log().debug << "Received request from " << peer << " ("
                  << request.size() << " bytes, fd=" << fd << ")";
      if (config_.handler) {
        config_.handler(fd, request, peer);
      } else {
        auto closed = addResponse(fd, "");
        if (!closed) {
          log().error << closed.error().message;
        }
      }
      return;
    }

    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      log().error << "Error reading from fd " << conn.fd << ": "
                  << std::strerror(errno);
      dropConnection(conn.fd);
    }
    return;
  }
}

void FetchServer::runLoop() {
  log().debug << "Server loop started";

  while (!isStopSet()) {
    auto waitResult = server_.waitForEvents(POLL_TIMEOUT_MS);
    if (!waitResult) {
      log().error << waitResult.error().message;
      break;
    }
    if (*waitResult) {
      acceptConnections();
    }

    if (activeConnections_.empty()) {
      continue;
    }
    struct epoll_event events[32];
    int n = epoll_wait(epollFd_, events, 32, POLL_TIMEOUT_MS);
    for (int i = 0; i < n; ++i) {
      auto it = activeConnections_.find(events[i].data.fd);
      if (it != activeConnections_.end()) {
        readFromConnection(it->second);
      }
    }
  }

  log().debug << "Server loop ended";
}

} // namespace network
} // namespace hr
