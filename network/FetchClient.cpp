#include "FetchClient.h"
#include "TcpConnection.h"

namespace hr {
namespace network {

FetchClient::FetchClient() : Module("network.fetch_client") {}

FetchClient::Roe<std::string>
FetchClient::fetchSync(const IpEndpoint &endpoint, const std::string &data,
                       std::chrono::milliseconds timeout) {
  auto connection = TcpConnection::connect(endpoint, timeout);
  if (!connection) {
    return Error(1, connection.error().message);
  }

  auto sent = connection->sendAndShutdown(data);
  if (!sent) {
    return Error(2, "Failed to send request: " + sent.error().message);
  }
  log().debug << "Sent " << *sent << " bytes to " << endpoint;

  auto response = connection->receiveAll(MAX_RESPONSE_BYTES);
  if (!response) {
    return Error(3, "Failed to read response from " + endpoint.ltsToString() +
                        ": " + response.error().message);
  }
  log().debug << "Received " << response->size() << " bytes from " << endpoint;
  return *response;
}

} // namespace network
} // namespace hr
