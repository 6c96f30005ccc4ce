#pragma once

#include "ResultOrError.hpp"
#include "Types.hpp"

#include <cstdint>
#include <string>

namespace hr {
namespace network {

/**
 * Non-blocking listening socket watched with epoll.
 */
class TcpServer {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  TcpServer() = default;
  ~TcpServer();

  TcpServer(const TcpServer &) = delete;
  TcpServer &operator=(const TcpServer &) = delete;

  /**
   * Bind and listen. Port 0 picks a free port, see getEndpoint().
   */
  Roe<void> listen(const IpEndpoint &endpoint, int backlog = 64);

  /**
   * Accept a pending connection
   * @return The connected socket, in non-blocking mode
   */
  Roe<int> accept();

  /**
   * Wait for incoming connections
   * @return false on timeout
   */
  Roe<bool> waitForEvents(int timeoutMs);

  void stop();

  bool isListening() const { return listening_; }
  const IpEndpoint &getEndpoint() const { return endpoint_; }

private:
  int socketFd_{ -1 };
  int epollFd_{ -1 };
  bool listening_{ false };
  IpEndpoint endpoint_;
};

} // namespace network
} // namespace hr
