#include "TcpServer.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hr {
namespace network {

namespace {

bool setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

bool resolveAddress(const std::string &host, in_addr &addr) {
  if (host.empty() || host == "0.0.0.0" || host == "*") {
    addr.s_addr = htonl(INADDR_ANY);
    return true;
  }
  if (inet_pton(AF_INET, host.c_str(), &addr) == 1) {
    return true;
  }
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  struct addrinfo *resolved = nullptr;
  if (getaddrinfo(host.c_str(), nullptr, &hints, &resolved) != 0 ||
      resolved == nullptr) {
    return false;
  }
  addr = reinterpret_cast<sockaddr_in *>(resolved->ai_addr)->sin_addr;
  freeaddrinfo(resolved);
  return true;
}

} // namespace

TcpServer::~TcpServer() { stop(); }

TcpServer::Roe<void> TcpServer::listen(const IpEndpoint &endpoint,
                                       int backlog) {
  if (listening_) {
    return Error(1, "Server already listening");
  }

  struct sockaddr_in serverAddr;
  std::memset(&serverAddr, 0, sizeof(serverAddr));
  serverAddr.sin_family = AF_INET;
  serverAddr.sin_port = htons(endpoint.port);
  if (!resolveAddress(endpoint.address, serverAddr.sin_addr)) {
    return Error(2, "Failed to resolve " + endpoint.address);
  }

  socketFd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (socketFd_ < 0) {
    return Error(3, "Failed to create socket: " + std::string(std::strerror(errno)));
  }

  int opt = 1;
  if (setsockopt(socketFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    stop();
    return Error(3, "Failed to set socket options");
  }

  if (bind(socketFd_, (struct sockaddr *)&serverAddr, sizeof(serverAddr)) < 0) {
    std::string reason = std::strerror(errno);
    stop();
    return Error(4, "Failed to bind to " + endpoint.ltsToString() + ": " +
                        reason);
  }

  if (::listen(socketFd_, backlog) < 0) {
    stop();
    return Error(4, "Failed to listen on " + endpoint.ltsToString());
  }

  if (!setNonBlocking(socketFd_)) {
    stop();
    return Error(3, "Failed to set socket to non-blocking mode");
  }

  epollFd_ = epoll_create1(0);
  if (epollFd_ < 0) {
    stop();
    return Error(5, "Failed to create epoll instance");
  }

  struct epoll_event event = {};
  event.events = EPOLLIN;
  event.data.fd = socketFd_;
  if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, socketFd_, &event) < 0) {
    stop();
    return Error(5, "Failed to add socket to epoll");
  }

  struct sockaddr_in boundAddr;
  socklen_t boundLen = sizeof(boundAddr);
  endpoint_ = endpoint;
  if (getsockname(socketFd_, (struct sockaddr *)&boundAddr, &boundLen) == 0) {
    endpoint_.port = ntohs(boundAddr.sin_port);
  }

  listening_ = true;
  return {};
}

TcpServer::Roe<int> TcpServer::accept() {
  if (!listening_) {
    return Error(6, "Server not listening");
  }

  int clientFd = ::accept(socketFd_, nullptr, nullptr);
  if (clientFd < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return Error(7, "No pending connections");
    }
    return Error(8, "Failed to accept connection: " +
                        std::string(std::strerror(errno)));
  }
  if (!setNonBlocking(clientFd)) {
    ::close(clientFd);
    return Error(3, "Failed to set connection to non-blocking mode");
  }
  return clientFd;
}

TcpServer::Roe<bool> TcpServer::waitForEvents(int timeoutMs) {
  if (!listening_) {
    return Error(6, "Server not listening");
  }

  struct epoll_event event;
  int n = epoll_wait(epollFd_, &event, 1, timeoutMs);
  if (n < 0) {
    if (errno == EINTR) {
      return false;
    }
    return Error(9, "epoll_wait failed: " + std::string(std::strerror(errno)));
  }
  return n > 0;
}

void TcpServer::stop() {
  if (epollFd_ >= 0) {
    ::close(epollFd_);
    epollFd_ = -1;
  }
  if (socketFd_ >= 0) {
    ::close(socketFd_);
    socketFd_ = -1;
  }
  listening_ = false;
}

} // namespace network
} // namespace hr
