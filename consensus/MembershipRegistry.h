#pragma once

#include "Errors.h"
#include "Module.h"
#include "Types.hpp"

#include <map>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace hr {
namespace consensus {

/**
 * MembershipRegistry - known nodes and their consensus eligibility.
 *
 * Registration is an upsert; records are never deleted, only deactivated
 * or suspended, and every penalty leaves an audit entry. Owned by the
 * single consensus writer, not synchronized.
 */
class MembershipRegistry : public Module {
public:
  struct Config {
    uint64_t minStake{ DEFAULT_MIN_STAKE };
    double minPerformance{ DEFAULT_MIN_PERFORMANCE };
    uint32_t maxSlashes{ DEFAULT_MAX_SLASHES };
    double emaAlpha{ DEFAULT_EMA_ALPHA };
    double slashReputationPenalty{ 0.1 };
    double slashPerformancePenalty{ 0.1 };
    double rewardReputationBonus{ 0.01 };
    int64_t heartbeatTimeoutMs{ 30000 }; // 0 disables liveness expiry
  };

  constexpr static uint64_t DEFAULT_MIN_STAKE = 100000;
  constexpr static double DEFAULT_MIN_PERFORMANCE = 0.7;
  constexpr static uint32_t DEFAULT_MAX_SLASHES = 5;
  constexpr static double DEFAULT_EMA_ALPHA = 0.1;

  MembershipRegistry();
  ~MembershipRegistry() override = default;

  // ----- accessors -----
  const Config &getConfig() const { return config_; }
  bool hasNode(const std::string &nodeId) const;
  Roe<Node> getNode(const std::string &nodeId) const;
  std::vector<Node> getNodes() const;
  size_t getNodeCount() const { return nodes_.size(); }

  /**
   * validator type, live, status ACTIVE, stake >= minStake,
   * performance >= minPerformance and fewer than maxSlashes slashes
   */
  bool isEligible(const Node &node) const;
  bool isEligibleForConsensus(const std::string &nodeId) const;
  std::set<std::string> getEligibleValidators() const;

  // ----- methods -----
  void init(const Config &config);

  /**
   * Insert a node, or update address, port, type, stake and metadata of a
   * known one. Scores, slashes, status and audit history are kept.
   */
  Roe<void> registerNode(const Node &node, int64_t nowMs);

  /**
   * Blend an observation into the performance score:
   * score = alpha * sample + (1 - alpha) * score
   * @return The new score
   */
  Roe<double> updatePerformance(const std::string &nodeId, double sample);

  Roe<void> addSlash(const std::string &nodeId, const std::string &reason,
                     int64_t nowMs);
  Roe<void> addReward(const std::string &nodeId, uint64_t amount,
                      int64_t nowMs);
  Roe<void> heartbeat(const std::string &nodeId, int64_t nowMs);

  /**
   * Explicit operator action (deactivate, suspend, reactivate)
   */
  Roe<void> setStatus(const std::string &nodeId, NodeStatus status,
                      const std::string &reason, int64_t nowMs);

  /**
   * Mark nodes without a heartbeat for heartbeatTimeoutMs as not live
   * @return Ids of the nodes that changed
   */
  std::vector<std::string> expireStale(int64_t nowMs);

private:
  Roe<Node *> find(const std::string &nodeId);
  static Roe<void> validate(const Node &node);

  Config config_;
  std::map<std::string, Node> nodes_;
};

std::ostream &operator<<(std::ostream &os,
                         const MembershipRegistry::Config &config);

} // namespace consensus
} // namespace hr
