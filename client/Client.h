#ifndef HR_CLIENT_H
#define HR_CLIENT_H

#include "../consensus/Types.hpp"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "../network/FetchClient.h"
#include "../network/Types.hpp"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace hr {

/**
 * Client - typed requests to a node's service boundary.
 *
 * Each call is one FetchClient round trip. On success the "result" object
 * of the response is returned; a refused request comes back as
 * E_SERVER_ERROR carrying the node's status code and error kind.
 */
class Client : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;

    // Set for E_SERVER_ERROR
    int status{ 0 };
    std::string kind;
    std::string field;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Default connection settings
  static constexpr const char *DEFAULT_HOST = "localhost";
  static constexpr const uint16_t DEFAULT_PORT = 8720;

  /** Timeout for status, lookups and single votes. */
  static constexpr std::chrono::milliseconds TIMEOUT_FAST{ 5000 };
  /** Timeout for batch submission and event pages. */
  static constexpr std::chrono::milliseconds TIMEOUT_DATA{ 15000 };

  // Error codes
  static constexpr const int32_t E_NOT_CONNECTED = 1;
  static constexpr const int32_t E_REQUEST_FAILED = 2;
  static constexpr const int32_t E_PARSE_ERROR = 3;
  static constexpr const int32_t E_SERVER_ERROR = 4;

  static std::string getErrorMessage(int32_t errorCode);

  Client();
  ~Client() override = default;

  // ----- accessors -----
  const network::IpEndpoint &getEndpoint() const { return endpoint_; }

  // ----- methods -----
  /**
   * @param endpoint "host:port"
   */
  Roe<void> setEndpoint(const std::string &endpoint);
  void setEndpoint(const network::IpEndpoint &endpoint);

  Roe<nlohmann::json> fetchStatus();
  Roe<nlohmann::json> fetchNode(const std::string &nodeId);
  Roe<nlohmann::json> fetchTransaction(const std::string &txId);
  Roe<nlohmann::json> fetchBlock(const std::string &blockHash);
  Roe<nlohmann::json> fetchEvents(uint64_t afterSeq, uint64_t maxCount);

  Roe<nlohmann::json> submitTransaction(const consensus::Transaction &tx);
  Roe<nlohmann::json>
  submitBatch(const std::vector<consensus::Transaction> &txs);

  Roe<nlohmann::json> proposeBlock(const consensus::Block &block,
                                   std::optional<uint64_t> term = {});
  Roe<nlohmann::json> voteOnBlock(const std::string &blockHash,
                                  const std::string &voterId, bool approve);

  Roe<nlohmann::json> registerNode(const consensus::Node &node);
  Roe<nlohmann::json> heartbeat(const std::string &nodeId);
  Roe<nlohmann::json> slashNode(const std::string &nodeId,
                                const std::string &reason);
  Roe<nlohmann::json> setNodeStatus(const std::string &nodeId,
                                    consensus::NodeStatus status,
                                    const std::string &reason);

  /**
   * Send any request object; "type" names the operation
   */
  Roe<nlohmann::json>
  sendRequest(const nlohmann::json &request,
              std::chrono::milliseconds timeout = TIMEOUT_FAST);

private:
  network::IpEndpoint endpoint_;
  network::FetchClient fetchClient_;
};

std::ostream &operator<<(std::ostream &os, const Client::Error &error);

} // namespace hr

#endif // HR_CLIENT_H
