#include "Client.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"
#include "../server/JsonCodec.h"

namespace hr {

using nlohmann::json;

Client::Client() : Module("client") {
  fetchClient_.redirectLogger(log().getFullName() + ".FetchClient");
}

std::string Client::getErrorMessage(int32_t errorCode) {
  switch (errorCode) {
  case E_NOT_CONNECTED:
    return "Not connected to server";
  case E_REQUEST_FAILED:
    return "Request failed";
  case E_PARSE_ERROR:
    return "Failed to parse response";
  case E_SERVER_ERROR:
    return "Server error";
  default:
    return "Unknown error";
  }
}

Client::Roe<void> Client::setEndpoint(const std::string &endpoint) {
  network::IpEndpoint ep;
  if (!utl::parseHostPort(endpoint, ep.address, ep.port) || ep.port == 0) {
    return Error(E_NOT_CONNECTED, "Invalid endpoint: " + endpoint);
  }
  endpoint_ = ep;
  return {};
}

void Client::setEndpoint(const network::IpEndpoint &endpoint) {
  endpoint_ = endpoint;
}

Client::Roe<json> Client::sendRequest(const json &request,
                                      std::chrono::milliseconds timeout) {
  if (endpoint_.port == 0) {
    return Error(E_NOT_CONNECTED, getErrorMessage(E_NOT_CONNECTED));
  }

  log().debug << "Sending request to " << endpoint_ << ": " << request.dump();
  auto result = fetchClient_.fetchSync(endpoint_, request.dump(), timeout);
  if (!result) {
    return Error(E_REQUEST_FAILED, getErrorMessage(E_REQUEST_FAILED) + ": " +
                                       result.error().message);
  }

  auto parsed = utl::parseJson(*result);
  if (!parsed || !parsed->is_object()) {
    std::string detail = parsed ? "not an object" : parsed.error().message;
    log().error << "Failed to parse response: " << detail;
    return Error(E_PARSE_ERROR, getErrorMessage(E_PARSE_ERROR) + ": " + detail);
  }

  const json &response = *parsed;
  auto ok = response.find("ok");
  if (ok == response.end() || !ok->is_boolean() || !ok->get<bool>()) {
    Error error(E_SERVER_ERROR, "unknown error");
    auto body = response.find("error");
    if (body != response.end() && body->is_object()) {
      for (auto check : { codec::readString(*body, "message", error.message, false),
                          codec::readString(*body, "kind", error.kind, false),
                          codec::readString(*body, "field", error.field, false) }) {
        if (!check) {
          log().warning << "Malformed error body: " << check.error().message;
        }
      }
    }
    auto status = response.find("status");
    if (status != response.end() && status->is_number_integer()) {
      error.status = status->get<int>();
    }
    return error;
  }
  auto found = response.find("result");
  if (found == response.end()) {
    return json::object();
  }
  return *found;
}

Client::Roe<json> Client::fetchStatus() {
  return sendRequest({ { "type", "getStatus" } });
}

Client::Roe<json> Client::fetchNode(const std::string &nodeId) {
  return sendRequest({ { "type", "getNode" }, { "node_id", nodeId } });
}

Client::Roe<json> Client::fetchTransaction(const std::string &txId) {
  return sendRequest(
      { { "type", "getTransaction" }, { "transaction_id", txId } });
}

Client::Roe<json> Client::fetchBlock(const std::string &blockHash) {
  return sendRequest({ { "type", "getBlock" }, { "block_hash", blockHash } });
}

Client::Roe<json> Client::fetchEvents(uint64_t afterSeq, uint64_t maxCount) {
  return sendRequest({ { "type", "streamEvents" },
                       { "after_seq", afterSeq },
                       { "max", maxCount } },
                     TIMEOUT_DATA);
}

Client::Roe<json> Client::submitTransaction(const consensus::Transaction &tx) {
  return sendRequest(
      { { "type", "submitTransaction" }, { "transaction", codec::toJson(tx) } });
}

Client::Roe<json>
Client::submitBatch(const std::vector<consensus::Transaction> &txs) {
  json items = json::array();
  for (const auto &tx : txs) {
    items.push_back(codec::toJson(tx));
  }
  return sendRequest({ { "type", "submitBatch" }, { "transactions", items } },
                     TIMEOUT_DATA);
}

Client::Roe<json> Client::proposeBlock(const consensus::Block &block,
                                       std::optional<uint64_t> term) {
  json request = { { "type", "proposeBlock" }, { "block", codec::toJson(block) } };
  if (term) {
    request["term"] = *term;
  }
  return sendRequest(request);
}

Client::Roe<json> Client::voteOnBlock(const std::string &blockHash,
                                      const std::string &voterId,
                                      bool approve) {
  return sendRequest({ { "type", "voteOnBlock" },
                       { "block_hash", blockHash },
                       { "voter_id", voterId },
                       { "approve", approve } });
}

Client::Roe<json> Client::registerNode(const consensus::Node &node) {
  return sendRequest(
      { { "type", "registerNode" }, { "node", codec::toJson(node) } });
}

Client::Roe<json> Client::heartbeat(const std::string &nodeId) {
  return sendRequest({ { "type", "nodeHeartbeat" }, { "node_id", nodeId } });
}

Client::Roe<json> Client::slashNode(const std::string &nodeId,
                                    const std::string &reason) {
  return sendRequest(
      { { "type", "slashNode" }, { "node_id", nodeId }, { "reason", reason } });
}

Client::Roe<json> Client::setNodeStatus(const std::string &nodeId,
                                        consensus::NodeStatus status,
                                        const std::string &reason) {
  return sendRequest({ { "type", "setNodeStatus" },
                       { "node_id", nodeId },
                       { "status", consensus::toString(status) },
                       { "reason", reason } });
}

std::ostream &operator<<(std::ostream &os, const Client::Error &error) {
  os << error.message;
  if (error.code == Client::E_SERVER_ERROR) {
    os << " (" << error.status << " " << error.kind;
    if (!error.field.empty()) {
      os << ", field " << error.field;
    }
    os << ")";
  }
  return os;
}

} // namespace hr
