#ifndef HR_RPC_SERVICE_H
#define HR_RPC_SERVICE_H

#include "ConsensusNode.h"
#include "../lib/Module.h"

#include <nlohmann/json.hpp>
#include <string>

namespace hr {

/**
 * RpcService - maps wire requests onto ConsensusNode operations.
 *
 * Request: { "type": "<operation>", ...fields }
 * Response: { "ok": true, "status": 200, "result": {...} } or
 *           { "ok": false, "status": <code>, "error": { "kind", "message",
 *             "field"? } }
 *
 * Client operations: proposeBlock, voteOnBlock, getStatus,
 * submitTransaction, submitBatch, registerNode, nodeHeartbeat, slashNode,
 * setNodeStatus, getNode, getTransaction, getBlock, streamEvents.
 * Peer operations: requestVote, leaderHeartbeat.
 *
 * Runs on the node's single writer thread.
 */
class RpcService : public Module {
public:
  using Error = consensus::Error;
  using ErrorKind = consensus::ErrorKind;
  template <typename T> using Roe = consensus::Roe<T>;

  constexpr static uint64_t DEFAULT_STREAM_LIMIT = 100;
  constexpr static uint64_t MAX_STREAM_LIMIT = 1000;

  explicit RpcService(ConsensusNode &node);
  ~RpcService() override = default;

  /**
   * Status code reported for an error kind (400, 403, 404, 409, 413, 500,
   * 503, 504)
   */
  static int statusFor(int32_t errorKind);

  static nlohmann::json okResponse(const nlohmann::json &result);
  static nlohmann::json errorResponse(const Error &error);

  /**
   * Parse and dispatch one serialized request
   * @return Serialized response, never empty
   */
  std::string handleRequest(const std::string &request);

  nlohmann::json handle(const nlohmann::json &request);

private:
  Roe<nlohmann::json> dispatch(const std::string &type,
                               const nlohmann::json &req);

  Roe<nlohmann::json> handleProposeBlock(const nlohmann::json &req);
  Roe<nlohmann::json> handleVoteOnBlock(const nlohmann::json &req);
  Roe<nlohmann::json> handleGetStatus(const nlohmann::json &req);
  Roe<nlohmann::json> handleSubmitTransaction(const nlohmann::json &req);
  Roe<nlohmann::json> handleSubmitBatch(const nlohmann::json &req);
  Roe<nlohmann::json> handleRegisterNode(const nlohmann::json &req);
  Roe<nlohmann::json> handleNodeHeartbeat(const nlohmann::json &req);
  Roe<nlohmann::json> handleSlashNode(const nlohmann::json &req);
  Roe<nlohmann::json> handleSetNodeStatus(const nlohmann::json &req);
  Roe<nlohmann::json> handleGetNode(const nlohmann::json &req);
  Roe<nlohmann::json> handleGetTransaction(const nlohmann::json &req);
  Roe<nlohmann::json> handleGetBlock(const nlohmann::json &req);
  Roe<nlohmann::json> handleStreamEvents(const nlohmann::json &req);
  Roe<nlohmann::json> handleRequestVote(const nlohmann::json &req);
  Roe<nlohmann::json> handleLeaderHeartbeat(const nlohmann::json &req);

  ConsensusNode &node_;
};

} // namespace hr

#endif // HR_RPC_SERVICE_H
