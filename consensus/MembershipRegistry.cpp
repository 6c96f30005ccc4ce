#include "MembershipRegistry.h"

#include <algorithm>
#include <cmath>

namespace hr {
namespace consensus {

namespace {

double clampUnit(double value) { return std::clamp(value, 0.0, 1.0); }

bool inUnitRange(double value) {
  return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

MembershipRegistry::MembershipRegistry() : Module("consensus.membership") {}

void MembershipRegistry::init(const Config &config) {
  config_ = config;
  log().info << "Initialized with " << config_;
}

bool MembershipRegistry::hasNode(const std::string &nodeId) const {
  return nodes_.count(nodeId) > 0;
}

Roe<Node> MembershipRegistry::getNode(const std::string &nodeId) const {
  auto it = nodes_.find(nodeId);
  if (it == nodes_.end()) {
    return Error(ErrorKind::VALIDATION, "Unknown node: " + nodeId);
  }
  return it->second;
}

std::vector<Node> MembershipRegistry::getNodes() const {
  std::vector<Node> result;
  result.reserve(nodes_.size());
  for (const auto &[id, node] : nodes_) {
    result.push_back(node);
  }
  return result;
}

bool MembershipRegistry::isEligible(const Node &node) const {
  return node.type == NodeType::VALIDATOR && node.isActive &&
         node.status == NodeStatus::ACTIVE && node.stake >= config_.minStake &&
         node.performanceScore >= config_.minPerformance &&
         node.slashCount < config_.maxSlashes;
}

bool MembershipRegistry::isEligibleForConsensus(const std::string &nodeId) const {
  auto it = nodes_.find(nodeId);
  return it != nodes_.end() && isEligible(it->second);
}

std::set<std::string> MembershipRegistry::getEligibleValidators() const {
  std::set<std::string> result;
  for (const auto &[id, node] : nodes_) {
    if (isEligible(node)) {
      result.insert(id);
    }
  }
  return result;
}

Roe<void> MembershipRegistry::validate(const Node &node) {
  if (node.nodeId.empty()) {
    return Error(ErrorKind::VALIDATION, "nodeId: must not be empty");
  }
  if (node.address.empty()) {
    return Error(ErrorKind::VALIDATION, "address: must not be empty");
  }
  if (node.port == 0) {
    return Error(ErrorKind::VALIDATION, "port: must be in 1..65535");
  }
  if (!inUnitRange(node.performanceScore)) {
    return Error(ErrorKind::VALIDATION, "performanceScore: must be in [0, 1]");
  }
  if (!inUnitRange(node.reputationScore)) {
    return Error(ErrorKind::VALIDATION, "reputationScore: must be in [0, 1]");
  }
  return {};
}

Roe<Node *> MembershipRegistry::find(const std::string &nodeId) {
  auto it = nodes_.find(nodeId);
  if (it == nodes_.end()) {
    return Error(ErrorKind::VALIDATION, "Unknown node: " + nodeId);
  }
  return &it->second;
}

Roe<void> MembershipRegistry::registerNode(const Node &node, int64_t nowMs) {
  auto valid = validate(node);
  if (!valid) {
    return valid;
  }

  auto it = nodes_.find(node.nodeId);
  if (it == nodes_.end()) {
    Node record = node;
    record.slashCount = 0;
    record.rewards = 0;
    record.isActive = true;
    record.lastSeenMs = nowMs;
    record.audit.clear();
    record.audit.push_back({nowMs, "registered", toString(record.type)});
    nodes_.emplace(record.nodeId, std::move(record));
    log().info << "Registered " << toString(node.type) << " " << node.nodeId
               << " stake=" << node.stake;
    return {};
  }

  Node &record = it->second;
  record.address = node.address;
  record.port = node.port;
  record.type = node.type;
  record.stake = node.stake;
  for (const auto &[key, value] : node.metadata) {
    record.metadata[key] = value;
  }
  record.isActive = true;
  record.lastSeenMs = nowMs;
  record.audit.push_back({nowMs, "updated", toString(record.type)});
  log().info << "Updated " << node.nodeId << " stake=" << node.stake;
  return {};
}

Roe<double> MembershipRegistry::updatePerformance(const std::string &nodeId,
                                                  double sample) {
  if (!inUnitRange(sample)) {
    return Error(ErrorKind::VALIDATION, "performance sample must be in [0, 1]");
  }
  auto node = find(nodeId);
  if (!node) {
    return node.error();
  }
  Node &record = **node;
  record.performanceScore = clampUnit(config_.emaAlpha * sample +
                                      (1.0 - config_.emaAlpha) *
                                          record.performanceScore);
  return record.performanceScore;
}

Roe<void> MembershipRegistry::addSlash(const std::string &nodeId,
                                       const std::string &reason,
                                       int64_t nowMs) {
  auto node = find(nodeId);
  if (!node) {
    return node.error();
  }
  Node &record = **node;
  record.slashCount += 1;
  record.reputationScore =
      clampUnit(record.reputationScore - config_.slashReputationPenalty);
  record.performanceScore =
      clampUnit(record.performanceScore - config_.slashPerformancePenalty);
  record.audit.push_back({nowMs, "slashed", reason});
  log().warning << "Slashed " << nodeId << " (" << record.slashCount
                << " total): " << reason;
  return {};
}

Roe<void> MembershipRegistry::addReward(const std::string &nodeId,
                                        uint64_t amount, int64_t nowMs) {
  auto node = find(nodeId);
  if (!node) {
    return node.error();
  }
  Node &record = **node;
  record.rewards += amount;
  record.reputationScore =
      clampUnit(record.reputationScore + config_.rewardReputationBonus);
  record.lastSeenMs = std::max(record.lastSeenMs, nowMs);
  return {};
}

Roe<void> MembershipRegistry::heartbeat(const std::string &nodeId,
                                        int64_t nowMs) {
  auto node = find(nodeId);
  if (!node) {
    return node.error();
  }
  Node &record = **node;
  if (!record.isActive) {
    record.audit.push_back({nowMs, "live", "heartbeat resumed"});
    log().info << nodeId << " is live again";
  }
  record.isActive = true;
  record.lastSeenMs = std::max(record.lastSeenMs, nowMs);
  return {};
}

Roe<void> MembershipRegistry::setStatus(const std::string &nodeId,
                                        NodeStatus status,
                                        const std::string &reason,
                                        int64_t nowMs) {
  auto node = find(nodeId);
  if (!node) {
    return node.error();
  }
  Node &record = **node;
  if (record.status == status) {
    return {};
  }
  record.audit.push_back({nowMs, "status " + toString(record.status) + " -> " +
                                     toString(status),
                          reason});
  record.status = status;
  log().info << nodeId << " status set to " << toString(status) << ": "
             << reason;
  return {};
}

std::vector<std::string> MembershipRegistry::expireStale(int64_t nowMs) {
  std::vector<std::string> changed;
  if (config_.heartbeatTimeoutMs <= 0) {
    return changed;
  }
  for (auto &[id, node] : nodes_) {
    if (node.isActive && nowMs - node.lastSeenMs > config_.heartbeatTimeoutMs) {
      node.isActive = false;
      node.audit.push_back({nowMs, "not live", "heartbeat timeout"});
      changed.push_back(id);
      log().warning << id << " missed heartbeats for "
                    << (nowMs - node.lastSeenMs) << " ms";
    }
  }
  return changed;
}

std::ostream &operator<<(std::ostream &os,
                         const MembershipRegistry::Config &config) {
  os << "minStake=" << config.minStake
     << " minPerformance=" << config.minPerformance
     << " maxSlashes=" << config.maxSlashes << " emaAlpha=" << config.emaAlpha
     << " heartbeatTimeoutMs=" << config.heartbeatTimeoutMs;
  return os;
}

} // namespace consensus
} // namespace hr
