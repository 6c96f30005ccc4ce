#include "RpcService.h"
#include "JsonCodec.h"
#include "../lib/Utilities.h"

namespace hr {

using consensus::Block;
using consensus::Transaction;
using nlohmann::json;

RpcService::RpcService(ConsensusNode &node)
    : Module("server.rpc"), node_(node) {}

int RpcService::statusFor(int32_t errorKind) {
  switch (errorKind) {
  case ErrorKind::VALIDATION:
  case ErrorKind::INVALID_TRANSACTION:
  case ErrorKind::EMPTY_BATCH:
    return 400;
  case ErrorKind::UNKNOWN_VOTER:
    return 403;
  case ErrorKind::BLOCK_NOT_FOUND:
    return 404;
  case ErrorKind::NOT_LEADER:
  case ErrorKind::STALE_TERM:
  case ErrorKind::DUPLICATE_VOTE:
    return 409;
  case ErrorKind::BATCH_TOO_LARGE:
    return 413;
  case ErrorKind::BUFFER_FULL:
    return 503;
  case ErrorKind::QUORUM_TIMEOUT:
    return 504;
  case ErrorKind::INTERNAL:
  default:
    return 500;
  }
}

json RpcService::okResponse(const json &result) {
  json resp;
  resp["ok"] = true;
  resp["status"] = 200;
  resp["result"] = result;
  return resp;
}

json RpcService::errorResponse(const Error &error) {
  json resp;
  resp["ok"] = false;
  resp["status"] = statusFor(error.code);
  resp["error"]["kind"] = consensus::errorKindName(error.code);
  resp["error"]["message"] = error.message;
  if (!error.field.empty()) {
    resp["error"]["field"] = error.field;
  }
  return resp;
}

std::string RpcService::handleRequest(const std::string &request) {
  auto parsed = utl::parseJsonRequest(request);
  if (!parsed) {
    log().warning << "Bad request: " << parsed.error().message;
    return errorResponse(Error(ErrorKind::VALIDATION, parsed.error().message))
        .dump();
  }
  return handle(*parsed).dump();
}

json RpcService::handle(const json &request) {
  if (!request.is_object() || !request.contains("type") ||
      !request["type"].is_string()) {
    return errorResponse(Error(ErrorKind::VALIDATION, "missing type field"));
  }
  std::string type = request["type"].get<std::string>();
  log().debug << "Request " << type;

  auto result = dispatch(type, request);
  if (!result) {
    log().debug << type << " failed: " << result.error().message;
    return errorResponse(result.error());
  }
  return okResponse(*result);
}

RpcService::Roe<json> RpcService::dispatch(const std::string &type,
                                           const json &req) {
  if (type == "proposeBlock") {
    return handleProposeBlock(req);
  } else if (type == "voteOnBlock") {
    return handleVoteOnBlock(req);
  } else if (type == "getStatus") {
    return handleGetStatus(req);
  } else if (type == "submitTransaction") {
    return handleSubmitTransaction(req);
  } else if (type == "submitBatch") {
    return handleSubmitBatch(req);
  } else if (type == "registerNode") {
    return handleRegisterNode(req);
  } else if (type == "nodeHeartbeat") {
    return handleNodeHeartbeat(req);
  } else if (type == "slashNode") {
    return handleSlashNode(req);
  } else if (type == "setNodeStatus") {
    return handleSetNodeStatus(req);
  } else if (type == "getNode") {
    return handleGetNode(req);
  } else if (type == "getTransaction") {
    return handleGetTransaction(req);
  } else if (type == "getBlock") {
    return handleGetBlock(req);
  } else if (type == "streamEvents") {
    return handleStreamEvents(req);
  } else if (type == "requestVote") {
    return handleRequestVote(req);
  } else if (type == "leaderHeartbeat") {
    return handleLeaderHeartbeat(req);
  }
  return Error(ErrorKind::VALIDATION, "unknown request type: " + type);
}

// ----- consensus -----

RpcService::Roe<json> RpcService::handleProposeBlock(const json &req) {
  if (!req.contains("block")) {
    return Error(ErrorKind::VALIDATION, "block: is required");
  }
  auto block = codec::blockFromJson(req["block"]);
  if (!block) {
    return block.error();
  }
  uint64_t term = 0;
  auto hasTerm = codec::readUInt(req, "term", term, false);
  if (!hasTerm) {
    return hasTerm.error();
  }

  std::optional<uint64_t> proposalTerm;
  if (req.contains("term") && !req["term"].is_null()) {
    proposalTerm = term;
  }
  auto proposed = node_.proposeBlock(*block, proposalTerm);
  if (!proposed) {
    return proposed.error();
  }

  json result;
  result["accepted"] = true;
  result["block_hash"] = proposed->hash;
  result["message"] = "Block " + consensus::toString(proposed->state);
  result["block"] = codec::toJson(*proposed);
  return result;
}

RpcService::Roe<json> RpcService::handleVoteOnBlock(const json &req) {
  std::string blockHash;
  std::string voterId;
  bool approve = false;
  uint64_t term = 0;
  for (auto check : { codec::readString(req, "block_hash", blockHash, true),
                      codec::readString(req, "voter_id", voterId, true),
                      codec::readBool(req, "approve", approve, true),
                      codec::readUInt(req, "term", term, false) }) {
    if (!check) {
      return check.error();
    }
  }
  if (term > 0) {
    node_.handlePeerAck(term, voterId);
  }

  auto voted = node_.voteOnBlock(blockHash, voterId, approve);
  if (!voted) {
    return voted.error();
  }
  json result;
  result["accepted"] = true;
  result["message"] = "Vote recorded, block " +
                      consensus::toString(voted->state);
  result["block"] = codec::toJson(*voted);
  return result;
}

RpcService::Roe<json> RpcService::handleGetStatus(const json &) {
  return codec::toJson(node_.getStatus());
}

// ----- transactions -----

RpcService::Roe<json> RpcService::handleSubmitTransaction(const json &req) {
  if (!req.contains("transaction")) {
    return Error::invalidTransaction("transaction", "is required");
  }
  auto tx = codec::transactionFromJson(req["transaction"]);
  if (!tx) {
    return tx.error();
  }
  auto receipt = node_.submitTransaction(*tx);
  if (!receipt) {
    return receipt.error();
  }
  json result;
  result["success"] = true;
  result["transaction_id"] = receipt->id;
  result["hash"] = receipt->hash;
  return result;
}

RpcService::Roe<json> RpcService::handleSubmitBatch(const json &req) {
  if (!req.contains("transactions") || !req["transactions"].is_array()) {
    return Error(ErrorKind::VALIDATION, "transactions: must be an array");
  }
  const json &items = req["transactions"];
  size_t maxBatchSize = node_.getPipeline().getConfig().maxBatchSize;
  if (items.size() > maxBatchSize) {
    return Error(ErrorKind::BATCH_TOO_LARGE,
                 "Batch of " + std::to_string(items.size()) +
                     " exceeds the maximum of " + std::to_string(maxBatchSize));
  }

  // Undecodable items are reported like refused ones, keeping their index
  json errors = json::array();
  std::vector<Transaction> txs;
  std::vector<size_t> positions;
  for (size_t i = 0; i < items.size(); ++i) {
    auto tx = codec::transactionFromJson(items[i]);
    if (!tx) {
      std::string id;
      if (items[i].is_object() && items[i].contains("id") &&
          items[i]["id"].is_string()) {
        id = items[i]["id"].get<std::string>();
      }
      errors.push_back({ { "index", i },
                         { "id", id },
                         { "kind", consensus::errorKindName(tx.error().code) },
                         { "field", tx.error().field },
                         { "message", tx.error().message } });
      continue;
    }
    txs.push_back(*tx);
    positions.push_back(i);
  }

  json result;
  result["processed_count"] = 0;
  result["failed_count"] = errors.size();
  result["transaction_ids"] = json::array();
  result["receipts"] = json::array();
  if (items.empty() || !txs.empty()) {
    auto batch = node_.submitBatch(txs);
    if (!batch) {
      return batch.error();
    }
    result["processed_count"] = batch->accepted;
    result["failed_count"] = errors.size() + batch->rejected;
    for (const auto &receipt : batch->receipts) {
      result["transaction_ids"].push_back(receipt.id);
      result["receipts"].push_back(
          { { "id", receipt.id }, { "hash", receipt.hash } });
    }
    for (const auto &item : batch->errors) {
      errors.push_back(
          { { "index", positions[item.index] },
            { "id", item.id },
            { "kind", consensus::errorKindName(item.error.code) },
            { "field", item.error.field },
            { "message", item.error.message } });
    }
  }
  result["errors"] = errors;
  return result;
}

RpcService::Roe<json> RpcService::handleGetTransaction(const json &req) {
  std::string txId;
  auto valid = codec::readString(req, "transaction_id", txId, true);
  if (!valid) {
    return valid.error();
  }
  auto record = node_.getTransaction(txId);
  if (!record) {
    return record.error();
  }
  return codec::toJson(*record);
}

RpcService::Roe<json> RpcService::handleGetBlock(const json &req) {
  std::string blockHash;
  auto valid = codec::readString(req, "block_hash", blockHash, true);
  if (!valid) {
    return valid.error();
  }
  auto block = node_.getBlock(blockHash);
  if (!block) {
    return block.error();
  }
  return codec::toJson(*block);
}

// ----- membership -----

RpcService::Roe<json> RpcService::handleRegisterNode(const json &req) {
  if (!req.contains("node")) {
    return Error(ErrorKind::VALIDATION, "node: is required");
  }
  auto node = codec::nodeFromJson(req["node"]);
  if (!node) {
    return node.error();
  }
  auto registered = node_.registerNode(*node);
  if (!registered) {
    return registered.error();
  }
  json result;
  result["success"] = true;
  result["node_id"] = registered->nodeId;
  result["message"] = node_.getRegistry().isEligible(*registered)
                          ? "Registered, eligible for consensus"
                          : "Registered, not eligible for consensus";
  result["node"] = codec::toJson(*registered);
  return result;
}

RpcService::Roe<json> RpcService::handleNodeHeartbeat(const json &req) {
  std::string nodeId;
  auto valid = codec::readString(req, "node_id", nodeId, true);
  if (!valid) {
    return valid.error();
  }
  auto node = node_.heartbeat(nodeId);
  if (!node) {
    return node.error();
  }
  return codec::toJson(*node);
}

RpcService::Roe<json> RpcService::handleSlashNode(const json &req) {
  std::string nodeId;
  std::string reason;
  for (auto check : { codec::readString(req, "node_id", nodeId, true),
                      codec::readString(req, "reason", reason, true) }) {
    if (!check) {
      return check.error();
    }
  }
  auto node = node_.slashNode(nodeId, reason);
  if (!node) {
    return node.error();
  }
  return codec::toJson(*node);
}

RpcService::Roe<json> RpcService::handleSetNodeStatus(const json &req) {
  std::string nodeId;
  std::string statusName;
  std::string reason = "operator request";
  for (auto check : { codec::readString(req, "node_id", nodeId, true),
                      codec::readString(req, "status", statusName, true),
                      codec::readString(req, "reason", reason, false) }) {
    if (!check) {
      return check.error();
    }
  }
  consensus::NodeStatus status = consensus::NodeStatus::ACTIVE;
  if (!consensus::parseNodeStatus(statusName, status)) {
    Error error(ErrorKind::VALIDATION, "status: unknown node status '" +
                                           statusName + "'");
    error.field = "status";
    return error;
  }
  auto node = node_.setNodeStatus(nodeId, status, reason);
  if (!node) {
    return node.error();
  }
  return codec::toJson(*node);
}

RpcService::Roe<json> RpcService::handleGetNode(const json &req) {
  std::string nodeId;
  auto valid = codec::readString(req, "node_id", nodeId, true);
  if (!valid) {
    return valid.error();
  }
  auto node = node_.getNode(nodeId);
  if (!node) {
    return node.error();
  }
  return codec::toJson(*node);
}

// ----- events -----

RpcService::Roe<json> RpcService::handleStreamEvents(const json &req) {
  uint64_t afterSeq = 0;
  uint64_t maxCount = DEFAULT_STREAM_LIMIT;
  for (auto check : { codec::readUInt(req, "after_seq", afterSeq, false),
                      codec::readUInt(req, "max", maxCount, false) }) {
    if (!check) {
      return check.error();
    }
  }
  if (maxCount == 0 || maxCount > MAX_STREAM_LIMIT) {
    Error error(ErrorKind::VALIDATION,
                "max: must be in [1, " + std::to_string(MAX_STREAM_LIMIT) +
                    "]");
    error.field = "max";
    return error;
  }

  auto page = node_.getEventHub().since(afterSeq, maxCount);
  json result;
  result["events"] = json::array();
  for (const auto &event : page.events) {
    result["events"].push_back(codec::toJson(event));
  }
  result["next_seq"] = page.nextSeq;
  result["truncated"] = page.truncated;
  return result;
}

// ----- peers -----

RpcService::Roe<json> RpcService::handleRequestVote(const json &req) {
  ConsensusNode::Engine::VoteRequest request;
  for (auto check :
       { codec::readUInt(req, "term", request.term, true),
         codec::readString(req, "candidate_id", request.candidateId, true),
         codec::readUInt(req, "last_finalized_height",
                         request.lastFinalizedHeight, false),
         codec::readUInt(req, "last_log_term", request.lastLogTerm, false) }) {
    if (!check) {
      return check.error();
    }
  }
  auto response = node_.handleVoteRequest(request);
  json result;
  result["term"] = response.term;
  result["voter_id"] = response.voterId;
  result["granted"] = response.granted;
  return result;
}

RpcService::Roe<json> RpcService::handleLeaderHeartbeat(const json &req) {
  uint64_t term = 0;
  std::string leaderId;
  for (auto check : { codec::readUInt(req, "term", term, true),
                      codec::readString(req, "leader_id", leaderId, true) }) {
    if (!check) {
      return check.error();
    }
  }
  auto accepted = node_.handleLeaderHeartbeat(term, leaderId);
  if (!accepted) {
    return accepted.error();
  }
  json result;
  result["term"] = node_.getEngine().getTerm();
  result["node_id"] = node_.getNodeId();
  return result;
}

} // namespace hr
