#pragma once

#include "ResultOrError.hpp"
#include "Service.h"
#include "TcpServer.h"
#include "Types.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace hr {
namespace network {

/**
 * FetchServer - one request per connection.
 *
 * A client sends its request and half-closes the connection; the complete
 * request is handed to the handler together with the connection fd, and
 * the response is written back later with addResponse(), which closes the
 * connection.
 */
class FetchServer : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  using RequestHandler = std::function<void(int fd, const std::string &request,
                                            const IpEndpoint &peer)>;

  constexpr static size_t DEFAULT_MAX_REQUEST_BYTES = 16 * 1024 * 1024;

  struct Config {
    IpEndpoint endpoint;
    RequestHandler handler{ nullptr };
    size_t maxRequestBytes{ DEFAULT_MAX_REQUEST_BYTES };
  };

  FetchServer();
  ~FetchServer() override;

  IpEndpoint getEndpoint() const { return server_.getEndpoint(); }

  Service::Roe<void> start(const Config &config);

  /**
   * Write the response for a request received on fd and close it
   */
  Roe<void> addResponse(int fd, const std::string &response);

protected:
  void runLoop() override;
  Service::Roe<void> onStart() override;
  void onStop() override;

private:
  struct ActiveConnection {
    int fd{ -1 };
    std::string buffer;
    IpEndpoint endpoint;
  };

  void acceptConnections();
  void readFromConnection(ActiveConnection &conn);
  void dropConnection(int fd);

  TcpServer server_;
  Config config_;
  int epollFd_{ -1 };

  // Connections still receiving their request, service thread only
  std::map<int, ActiveConnection> activeConnections_;

  // Connections waiting for addResponse()
  std::mutex awaitingMutex_;
  std::set<int> awaitingResponse_;
};

} // namespace network
} // namespace hr
