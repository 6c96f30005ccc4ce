#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace hr {
namespace consensus {

enum class Role : uint8_t { FOLLOWER = 0, CANDIDATE = 1, LEADER = 2 };

enum class BlockState : uint8_t {
  PENDING = 0,   // open for voting at the next height
  BUFFERED = 1,  // accepted for a later height, waits for its predecessor
  FINALIZED = 2,
  REJECTED = 3,
  EXPIRED = 4,
};

enum class NodeType : uint8_t {
  VALIDATOR = 0,
  FULL_NODE = 1,
  LIGHT_NODE = 2,
  ARCHIVE_NODE = 3,
};

enum class NodeStatus : uint8_t { ACTIVE = 0, INACTIVE = 1, SUSPENDED = 2 };

enum class TxStatus : uint8_t {
  PENDING = 0,
  INCLUDED = 1,
  CONFIRMED = 2,
  REJECTED = 3,
  FAILED = 4,
};

struct Transaction {
  std::string id;
  std::string type;
  std::string fromAddress;
  std::string toAddress;
  double amount{ 0.0 };
  int64_t timestamp{ 0 };
  uint64_t nonce{ 0 };
  double gasPrice{ 0.0 };
  uint64_t gasLimit{ 0 };
  std::string signature; // hex, optional

  template <typename Archive> void serialize(Archive &ar) {
    ar & id & type & fromAddress & toAddress & amount & timestamp & nonce &
        gasPrice & gasLimit & signature;
  }

  // Bytes covered by the signature and the transaction hash
  std::string canonical() const;
  std::string computeHash() const;
};

struct Block {
  uint64_t height{ 0 };
  std::string hash;
  std::string previousHash;
  int64_t timestamp{ 0 };
  std::string validator;
  std::vector<Transaction> transactions;
  std::map<std::string, bool> votes;
  double confidenceScore{ 0.0 };
  uint64_t term{ 0 };
  BlockState state{ BlockState::PENDING };

  template <typename Archive> void serialize(Archive &ar) {
    ar & height & hash & previousHash & timestamp & validator & transactions &
        votes & confidenceScore & term & state;
  }

  /**
   * SHA-256 over the header fields and the transaction hashes
   */
  std::string computeHash() const;
  std::vector<std::string> transactionIds() const;
};

struct Vote {
  std::string blockHash;
  std::string voterId;
  bool approve{ false };
};

struct AuditEntry {
  int64_t timestampMs{ 0 };
  std::string action;
  std::string reason;

  template <typename Archive> void serialize(Archive &ar) {
    ar & timestampMs & action & reason;
  }
};

struct Node {
  std::string nodeId;
  std::string address;
  uint16_t port{ 0 };
  NodeType type{ NodeType::VALIDATOR };
  uint64_t stake{ 0 };
  double performanceScore{ 1.0 };
  bool isActive{ true };
  NodeStatus status{ NodeStatus::ACTIVE };
  double reputationScore{ 1.0 };
  uint32_t slashCount{ 0 };
  uint64_t rewards{ 0 };
  int64_t lastSeenMs{ 0 };
  std::map<std::string, std::string> metadata;
  std::vector<AuditEntry> audit;

  template <typename Archive> void serialize(Archive &ar) {
    ar & nodeId & address & port & type & stake & performanceScore & isActive &
        status & reputationScore & slashCount & rewards & lastSeenMs &
        metadata & audit;
  }
};

// Payload of a CONFIG log entry
struct ConfigChange {
  std::vector<std::string> validators;

  template <typename Archive> void serialize(Archive &ar) { ar & validators; }
};

enum class EventType : uint8_t {
  BLOCK_PROPOSED = 0,
  BLOCK_ACCEPTED = 1,
  BLOCK_REJECTED = 2,
  BLOCK_EXPIRED = 3,
  HEARTBEAT = 4,
  ELECTION_STARTED = 5,
  LEADER_ELECTED = 6,
  STEPPED_DOWN = 7,
};

struct ConsensusEvent {
  uint64_t seq{ 0 }; // assigned by the event hub
  EventType type{ EventType::HEARTBEAT };
  uint64_t term{ 0 };
  uint64_t height{ 0 };
  std::string blockHash;
  std::string nodeId;
  int64_t timestampMs{ 0 };
  std::string message;
};

std::string toString(Role role);
std::string toString(BlockState state);
std::string toString(NodeType type);
std::string toString(NodeStatus status);
std::string toString(TxStatus status);
std::string toString(EventType type);

bool parseNodeType(const std::string &str, NodeType &type);
bool parseNodeStatus(const std::string &str, NodeStatus &status);

} // namespace consensus
} // namespace hr
