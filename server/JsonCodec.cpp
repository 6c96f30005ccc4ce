#include "JsonCodec.h"

#include <limits>

namespace hr {
namespace codec {

using consensus::Block;
using consensus::Error;
using consensus::ErrorKind;
using consensus::Node;
using consensus::Roe;
using consensus::Transaction;
using nlohmann::json;

namespace {

Error fieldError(int32_t kind, const std::string &field,
                 const std::string &message) {
  Error error(kind, field + ": " + message);
  error.field = field;
  return error;
}

} // namespace

// ----- field readers -----

Roe<void> readString(const json &j, const std::string &key, std::string &out,
                     bool required, int32_t kind) {
  if (!j.contains(key) || j[key].is_null()) {
    if (required) {
      return fieldError(kind, key, "is required");
    }
    return {};
  }
  if (!j[key].is_string()) {
    return fieldError(kind, key, "must be a string");
  }
  out = j[key].get<std::string>();
  return {};
}

Roe<void> readUInt(const json &j, const std::string &key, uint64_t &out,
                   bool required, int32_t kind) {
  if (!j.contains(key) || j[key].is_null()) {
    if (required) {
      return fieldError(kind, key, "is required");
    }
    return {};
  }
  if (!j[key].is_number_integer() ||
      (!j[key].is_number_unsigned() && j[key].get<int64_t>() < 0)) {
    return fieldError(kind, key, "must be a non-negative integer");
  }
  out = j[key].get<uint64_t>();
  return {};
}

Roe<void> readInt(const json &j, const std::string &key, int64_t &out,
                  bool required, int32_t kind) {
  if (!j.contains(key) || j[key].is_null()) {
    if (required) {
      return fieldError(kind, key, "is required");
    }
    return {};
  }
  if (!j[key].is_number_integer()) {
    return fieldError(kind, key, "must be an integer");
  }
  if (j[key].is_number_unsigned() &&
      j[key].get<uint64_t>() >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return fieldError(kind, key, "is out of range");
  }
  out = j[key].get<int64_t>();
  return {};
}

Roe<void> readNumber(const json &j, const std::string &key, double &out,
                     bool required, int32_t kind) {
  if (!j.contains(key) || j[key].is_null()) {
    if (required) {
      return fieldError(kind, key, "is required");
    }
    return {};
  }
  if (!j[key].is_number()) {
    return fieldError(kind, key, "must be a number");
  }
  out = j[key].get<double>();
  return {};
}

Roe<void> readBool(const json &j, const std::string &key, bool &out,
                   bool required, int32_t kind) {
  if (!j.contains(key) || j[key].is_null()) {
    if (required) {
      return fieldError(kind, key, "is required");
    }
    return {};
  }
  if (!j[key].is_boolean()) {
    return fieldError(kind, key, "must be a boolean");
  }
  out = j[key].get<bool>();
  return {};
}

// ----- encoding -----

json toJson(const Transaction &tx) {
  json j;
  j["id"] = tx.id;
  j["type"] = tx.type;
  j["from_address"] = tx.fromAddress;
  j["to_address"] = tx.toAddress;
  j["amount"] = tx.amount;
  j["timestamp"] = tx.timestamp;
  j["nonce"] = tx.nonce;
  j["gas_price"] = tx.gasPrice;
  j["gas_limit"] = tx.gasLimit;
  if (!tx.signature.empty()) {
    j["signature"] = tx.signature;
  }
  return j;
}

json toJson(const Block &block) {
  json j;
  j["height"] = block.height;
  j["hash"] = block.hash;
  j["previous_hash"] = block.previousHash;
  j["timestamp"] = block.timestamp;
  j["validator"] = block.validator;
  j["transactions"] = json::array();
  for (const auto &tx : block.transactions) {
    j["transactions"].push_back(toJson(tx));
  }
  j["votes"] = json::object();
  for (const auto &[voterId, approve] : block.votes) {
    j["votes"][voterId] = approve;
  }
  j["confidence_score"] = block.confidenceScore;
  j["term"] = block.term;
  j["state"] = consensus::toString(block.state);
  return j;
}

json toJson(const Node &node) {
  json j;
  j["node_id"] = node.nodeId;
  j["address"] = node.address;
  j["port"] = node.port;
  j["type"] = consensus::toString(node.type);
  j["stake"] = node.stake;
  j["performance_score"] = node.performanceScore;
  j["is_active"] = node.isActive;
  j["status"] = consensus::toString(node.status);
  j["reputation_score"] = node.reputationScore;
  j["slash_count"] = node.slashCount;
  j["rewards"] = node.rewards;
  j["last_seen_ms"] = node.lastSeenMs;
  j["metadata"] = node.metadata;
  j["audit"] = json::array();
  for (const auto &entry : node.audit) {
    j["audit"].push_back({ { "timestamp_ms", entry.timestampMs },
                           { "action", entry.action },
                           { "reason", entry.reason } });
  }
  return j;
}

json toJson(const consensus::ConsensusEvent &event) {
  json j;
  j["seq"] = event.seq;
  j["type"] = consensus::toString(event.type);
  j["term"] = event.term;
  j["height"] = event.height;
  j["block_hash"] = event.blockHash;
  j["node_id"] = event.nodeId;
  j["timestamp_ms"] = event.timestampMs;
  j["message"] = event.message;
  return j;
}

json toJson(const TxPipeline::Record &record) {
  json j;
  j["transaction"] = toJson(record.tx);
  j["hash"] = record.hash;
  j["status"] = consensus::toString(record.status);
  j["attempts"] = record.attempts;
  j["submitted_at_ms"] = record.submittedAtMs;
  if (!record.blockHash.empty()) {
    j["block_hash"] = record.blockHash;
    j["block_height"] = record.blockHeight;
  }
  if (!record.lastError.empty()) {
    j["last_error"] = record.lastError;
  }
  return j;
}

json toJson(const ConsensusNode::Status &status) {
  const auto &c = status.consensus;
  json j;
  j["node_id"] = status.nodeId;
  j["current_round"] = c.currentRound;
  j["term"] = c.term;
  j["state"] = consensus::toString(c.role);
  j["leader"] = c.leader;
  j["active_validators"] = c.activeValidators;
  j["required_votes"] = c.requiredVotes;
  j["health"] = c.health;
  j["last_finalized_height"] = c.lastFinalizedHeight;
  j["last_finalized_hash"] = c.lastFinalizedHash;
  j["pending_blocks"] = c.pendingBlocks;
  j["buffered_blocks"] = c.bufferedBlocks;
  j["pending_transactions"] = status.pendingTransactions;
  j["known_nodes"] = status.knownNodes;
  j["log_size"] = status.logSize;
  j["last_event_seq"] = status.lastEventSeq;
  return j;
}

// ----- decoding -----

Roe<Transaction> transactionFromJson(const json &j) {
  const int32_t kind = ErrorKind::INVALID_TRANSACTION;
  if (!j.is_object()) {
    return Error::invalidTransaction("transaction", "must be an object");
  }

  Transaction tx;
  tx.type = "transfer";
  std::vector<Roe<void>> checks;
  checks.push_back(readString(j, "id", tx.id, true, kind));
  checks.push_back(readString(j, "type", tx.type, false, kind));
  checks.push_back(readString(j, "from_address", tx.fromAddress, true, kind));
  checks.push_back(readString(j, "to_address", tx.toAddress, true, kind));
  checks.push_back(readNumber(j, "amount", tx.amount, true, kind));
  checks.push_back(readInt(j, "timestamp", tx.timestamp, true, kind));
  checks.push_back(readUInt(j, "nonce", tx.nonce, false, kind));
  checks.push_back(readNumber(j, "gas_price", tx.gasPrice, false, kind));
  checks.push_back(readUInt(j, "gas_limit", tx.gasLimit, false, kind));
  checks.push_back(readString(j, "signature", tx.signature, false, kind));
  for (const auto &check : checks) {
    if (!check) {
      return check.error();
    }
  }
  return tx;
}

Roe<Block> blockFromJson(const json &j) {
  const int32_t kind = ErrorKind::VALIDATION;
  if (!j.is_object()) {
    return fieldError(kind, "block", "must be an object");
  }

  Block block;
  std::vector<Roe<void>> checks;
  checks.push_back(readUInt(j, "height", block.height, true, kind));
  checks.push_back(readString(j, "hash", block.hash, true, kind));
  checks.push_back(
      readString(j, "previous_hash", block.previousHash, false, kind));
  checks.push_back(readInt(j, "timestamp", block.timestamp, true, kind));
  checks.push_back(readString(j, "validator", block.validator, true, kind));
  for (const auto &check : checks) {
    if (!check) {
      return check.error();
    }
  }

  if (j.contains("transactions") && !j["transactions"].is_null()) {
    if (!j["transactions"].is_array()) {
      return fieldError(kind, "transactions", "must be an array");
    }
    for (size_t i = 0; i < j["transactions"].size(); ++i) {
      auto tx = transactionFromJson(j["transactions"][i]);
      if (!tx) {
        return fieldError(kind, "transactions",
                          "[" + std::to_string(i) + "] " + tx.error().message);
      }
      block.transactions.push_back(*tx);
    }
  }
  return block;
}

Roe<Node> nodeFromJson(const json &j) {
  const int32_t kind = ErrorKind::VALIDATION;
  if (!j.is_object()) {
    return fieldError(kind, "node", "must be an object");
  }

  Node node;
  uint64_t port = 0;
  std::string type = consensus::toString(node.type);
  std::vector<Roe<void>> checks;
  checks.push_back(readString(j, "node_id", node.nodeId, true, kind));
  checks.push_back(readString(j, "address", node.address, false, kind));
  checks.push_back(readUInt(j, "port", port, false, kind));
  checks.push_back(readString(j, "type", type, false, kind));
  checks.push_back(readUInt(j, "stake", node.stake, false, kind));
  for (const auto &check : checks) {
    if (!check) {
      return check.error();
    }
  }

  if (port > 65535) {
    return fieldError(kind, "port", "must be at most 65535");
  }
  node.port = static_cast<uint16_t>(port);
  if (!consensus::parseNodeType(type, node.type)) {
    return fieldError(kind, "type", "unknown node type '" + type + "'");
  }

  if (j.contains("metadata") && !j["metadata"].is_null()) {
    if (!j["metadata"].is_object()) {
      return fieldError(kind, "metadata", "must be an object");
    }
    for (auto it = j["metadata"].begin(); it != j["metadata"].end(); ++it) {
      if (!it.value().is_string()) {
        return fieldError(kind, "metadata", "values must be strings");
      }
      node.metadata[it.key()] = it.value().get<std::string>();
    }
  }
  return node;
}

} // namespace codec
} // namespace hr
