#include "Types.hpp"
#include "Serialize.hpp"
#include "Utilities.h"

#include <sstream>

namespace hr {
namespace consensus {

std::string Transaction::canonical() const {
  // Fixed field order, strings length-prefixed; the signature is excluded
  std::ostringstream oss;
  OutputArchive ar(oss);
  ar & id & type & fromAddress & toAddress & amount & timestamp & nonce &
      gasPrice & gasLimit;
  return oss.str();
}

std::string Transaction::computeHash() const { return utl::sha256(canonical()); }

std::string Block::computeHash() const {
  std::ostringstream oss;
  OutputArchive ar(oss);
  ar & height & previousHash & timestamp & validator;
  std::vector<std::string> txHashes;
  txHashes.reserve(transactions.size());
  for (const auto &tx : transactions) {
    txHashes.push_back(tx.computeHash());
  }
  ar & txHashes;
  return utl::sha256(oss.str());
}

std::vector<std::string> Block::transactionIds() const {
  std::vector<std::string> ids;
  ids.reserve(transactions.size());
  for (const auto &tx : transactions) {
    ids.push_back(tx.id);
  }
  return ids;
}

std::string toString(Role role) {
  switch (role) {
  case Role::FOLLOWER:
    return "follower";
  case Role::CANDIDATE:
    return "candidate";
  case Role::LEADER:
    return "leader";
  }
  return "unknown";
}

std::string toString(BlockState state) {
  switch (state) {
  case BlockState::PENDING:
    return "pending";
  case BlockState::BUFFERED:
    return "buffered";
  case BlockState::FINALIZED:
    return "finalized";
  case BlockState::REJECTED:
    return "rejected";
  case BlockState::EXPIRED:
    return "expired";
  }
  return "unknown";
}

std::string toString(NodeType type) {
  switch (type) {
  case NodeType::VALIDATOR:
    return "validator";
  case NodeType::FULL_NODE:
    return "full_node";
  case NodeType::LIGHT_NODE:
    return "light_node";
  case NodeType::ARCHIVE_NODE:
    return "archive_node";
  }
  return "unknown";
}

std::string toString(NodeStatus status) {
  switch (status) {
  case NodeStatus::ACTIVE:
    return "ACTIVE";
  case NodeStatus::INACTIVE:
    return "INACTIVE";
  case NodeStatus::SUSPENDED:
    return "SUSPENDED";
  }
  return "UNKNOWN";
}

std::string toString(TxStatus status) {
  switch (status) {
  case TxStatus::PENDING:
    return "pending";
  case TxStatus::INCLUDED:
    return "included";
  case TxStatus::CONFIRMED:
    return "confirmed";
  case TxStatus::REJECTED:
    return "rejected";
  case TxStatus::FAILED:
    return "failed";
  }
  return "unknown";
}

std::string toString(EventType type) {
  switch (type) {
  case EventType::BLOCK_PROPOSED:
    return "block_proposed";
  case EventType::BLOCK_ACCEPTED:
    return "block_accepted";
  case EventType::BLOCK_REJECTED:
    return "block_rejected";
  case EventType::BLOCK_EXPIRED:
    return "block_expired";
  case EventType::HEARTBEAT:
    return "heartbeat";
  case EventType::ELECTION_STARTED:
    return "election_started";
  case EventType::LEADER_ELECTED:
    return "leader_elected";
  case EventType::STEPPED_DOWN:
    return "stepped_down";
  }
  return "unknown";
}

bool parseNodeType(const std::string &str, NodeType &type) {
  for (auto candidate : {NodeType::VALIDATOR, NodeType::FULL_NODE,
                         NodeType::LIGHT_NODE, NodeType::ARCHIVE_NODE}) {
    if (toString(candidate) == str) {
      type = candidate;
      return true;
    }
  }
  return false;
}

bool parseNodeStatus(const std::string &str, NodeStatus &status) {
  for (auto candidate :
       {NodeStatus::ACTIVE, NodeStatus::INACTIVE, NodeStatus::SUSPENDED}) {
    if (toString(candidate) == str) {
      status = candidate;
      return true;
    }
  }
  return false;
}

} // namespace consensus
} // namespace hr
