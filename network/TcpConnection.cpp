#include "TcpConnection.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace hr {
namespace network {

namespace {

std::string errnoString() { return std::strerror(errno); }

} // namespace

TcpConnection::TcpConnection(int socketFd) : socketFd_(socketFd) {
  struct sockaddr_in peerAddr;
  socklen_t addrLen = sizeof(peerAddr);
  if (getpeername(socketFd_, (struct sockaddr *)&peerAddr, &addrLen) == 0 &&
      peerAddr.sin_family == AF_INET) {
    char addrStr[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &peerAddr.sin_addr, addrStr, INET_ADDRSTRLEN);
    peer_.address = addrStr;
    peer_.port = ntohs(peerAddr.sin_port);
  }
}

TcpConnection::~TcpConnection() { close(); }

TcpConnection::TcpConnection(TcpConnection &&other) noexcept
    : socketFd_(other.socketFd_), peer_(std::move(other.peer_)) {
  other.socketFd_ = -1;
  other.peer_ = {};
}

TcpConnection &TcpConnection::operator=(TcpConnection &&other) noexcept {
  if (this != &other) {
    close();
    socketFd_ = other.socketFd_;
    peer_ = std::move(other.peer_);
    other.socketFd_ = -1;
    other.peer_ = {};
  }
  return *this;
}

TcpConnection::Roe<TcpConnection>
TcpConnection::connect(const IpEndpoint &endpoint,
                       std::chrono::milliseconds timeout) {
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *resolved = nullptr;
  std::string port = std::to_string(endpoint.port);
  int rc = getaddrinfo(endpoint.address.c_str(), port.c_str(), &hints, &resolved);
  if (rc != 0 || resolved == nullptr) {
    return Error(1, "Failed to resolve " + endpoint.address + ": " +
                        gai_strerror(rc));
  }

  int fd = socket(resolved->ai_family, resolved->ai_socktype,
                  resolved->ai_protocol);
  if (fd < 0) {
    freeaddrinfo(resolved);
    return Error(2, "Failed to create socket: " + errnoString());
  }
  TcpConnection connection(fd);
  auto timeoutResult = connection.setTimeout(timeout);
  if (!timeoutResult) {
    freeaddrinfo(resolved);
    return timeoutResult.error();
  }

  if (::connect(fd, resolved->ai_addr, resolved->ai_addrlen) < 0) {
    std::string reason = errnoString();
    freeaddrinfo(resolved);
    return Error(3, "Failed to connect to " + endpoint.ltsToString() + ": " +
                        reason);
  }
  freeaddrinfo(resolved);
  connection.peer_ = endpoint;
  return connection;
}

TcpConnection::Roe<size_t> TcpConnection::send(const std::string &message) {
  if (socketFd_ < 0) {
    return Error(4, "Connection closed");
  }

  size_t total = 0;
  while (total < message.size()) {
    ssize_t sent = ::send(socketFd_, message.data() + total,
                          message.size() - total, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Error(5, "Failed to send data: " + errnoString());
    }
    total += static_cast<size_t>(sent);
  }
  return total;
}

TcpConnection::Roe<size_t>
TcpConnection::sendAndShutdown(const std::string &message) {
  auto result = send(message);
  if (!result) {
    return result;
  }

  auto shutdownResult = shutdownWrite();
  if (!shutdownResult) {
    return shutdownResult.error();
  }
  return result;
}

TcpConnection::Roe<void> TcpConnection::shutdownWrite() {
  if (socketFd_ < 0) {
    return Error(4, "Connection closed");
  }
  if (shutdown(socketFd_, SHUT_WR) < 0) {
    return Error(6, "Failed to shutdown write: " + errnoString());
  }
  return {};
}

TcpConnection::Roe<size_t> TcpConnection::receive(void *buffer,
                                                  size_t maxLength) {
  if (socketFd_ < 0) {
    return Error(4, "Connection closed");
  }

  while (true) {
    ssize_t received = recv(socketFd_, buffer, maxLength, 0);
    if (received >= 0) {
      return static_cast<size_t>(received);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return Error(7, "Receive timeout (no data within socket timeout)");
    }
    return Error(8, "Failed to receive data: " + errnoString());
  }
}

TcpConnection::Roe<std::string> TcpConnection::receiveAll(size_t maxBytes) {
  std::string data;
  char buffer[8192];
  while (true) {
    auto received = receive(buffer, sizeof(buffer));
    if (!received) {
      return received.error();
    }
    if (*received == 0) {
      return data;
    }
    data.append(buffer, *received);
    if (data.size() > maxBytes) {
      return Error(9, "Response exceeds " + std::to_string(maxBytes) +
                          " bytes");
    }
  }
}

TcpConnection::Roe<void>
TcpConnection::setTimeout(std::chrono::milliseconds timeout) {
  if (socketFd_ < 0) {
    return Error(4, "Connection closed");
  }

  struct timeval tv;
  tv.tv_sec = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;

  if (setsockopt(socketFd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    return Error(10, "Failed to set receive timeout: " + errnoString());
  }
  if (setsockopt(socketFd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    return Error(10, "Failed to set send timeout: " + errnoString());
  }
  return {};
}

void TcpConnection::close() {
  if (socketFd_ >= 0) {
    ::close(socketFd_);
    socketFd_ = -1;
  }
}

} // namespace network
} // namespace hr
