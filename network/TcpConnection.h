#pragma once

#include "ResultOrError.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace hr {
namespace network {

/**
 * Owns a connected stream socket; closed on destruction.
 */
class TcpConnection {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit TcpConnection(int socketFd);
  ~TcpConnection();

  TcpConnection(const TcpConnection &) = delete;
  TcpConnection &operator=(const TcpConnection &) = delete;

  TcpConnection(TcpConnection &&other) noexcept;
  TcpConnection &operator=(TcpConnection &&other) noexcept;

  /**
   * Connect to a remote endpoint, resolving the host name
   */
  static Roe<TcpConnection> connect(const IpEndpoint &endpoint,
                                    std::chrono::milliseconds timeout);

  // Send the whole buffer
  Roe<size_t> send(const std::string &message);

  // Send data and shutdown writing in one call
  Roe<size_t> sendAndShutdown(const std::string &message);

  // Shutdown writing (half-close the connection)
  Roe<void> shutdownWrite();

  Roe<size_t> receive(void *buffer, size_t maxLength);

  /**
   * Read until the peer closes its side
   * @param maxBytes Fails once more than this many bytes arrive
   */
  Roe<std::string> receiveAll(size_t maxBytes);

  // Set socket send/receive timeout (0 = no timeout)
  Roe<void> setTimeout(std::chrono::milliseconds timeout);

  void close();
  bool isOpen() const { return socketFd_ >= 0; }
  int getFd() const { return socketFd_; }

  const IpEndpoint &getPeerEndpoint() const { return peer_; }

private:
  int socketFd_{ -1 };
  IpEndpoint peer_;
};

} // namespace network
} // namespace hr
