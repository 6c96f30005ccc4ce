#ifndef HR_CONSENSUS_NODE_H
#define HR_CONSENSUS_NODE_H

#include "EventHub.h"
#include "TxPipeline.h"
#include "../consensus/ConsensusEngine.h"
#include "../consensus/MembershipRegistry.h"
#include "../ledger/LogStore.h"
#include "../lib/Clock.h"
#include "../lib/Delegator.hpp"
#include "../lib/Metrics.h"
#include "../lib/Module.h"

#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace hr {

/**
 * ConsensusNode - one replica: log, membership, consensus engine,
 * transaction pipeline and event history wired together.
 *
 * All methods must be called from a single thread (the node server's
 * service thread). Only the event hub may be read concurrently.
 */
class ConsensusNode : public Module,
                      public Delegator,
                      public consensus::ConsensusEngine::Delegate {
public:
  using Error = consensus::Error;
  using ErrorKind = consensus::ErrorKind;
  template <typename T> using Roe = consensus::Roe<T>;
  using Engine = consensus::ConsensusEngine;

  /**
   * Outbound peer messages. Set with setDelegate().
   */
  struct Transport : Delegator::Delegate {
    virtual void broadcastProposal(const consensus::Block &block) = 0;
    virtual void broadcastVote(const consensus::Vote &vote, uint64_t term) = 0;
    virtual void requestVotes(const Engine::VoteRequest &request) = 0;
    virtual void sendHeartbeat(uint64_t term, const std::string &leaderId,
                               uint64_t finalizedHeight) = 0;
  };

  struct Config {
    std::string workDir; // empty keeps the log in memory
    Engine::Config engine;
    consensus::MembershipRegistry::Config registry;
    TxPipeline::Config pipeline;
    std::vector<consensus::Node> validators; // registered at startup
    bool autoVote{ true };
    uint64_t blockReward{ DEFAULT_BLOCK_REWARD };
  };

  constexpr static uint64_t DEFAULT_BLOCK_REWARD = 1;

  struct Status {
    std::string nodeId;
    Engine::Status consensus;
    size_t pendingTransactions{ 0 };
    size_t knownNodes{ 0 };
    uint64_t logSize{ 0 };
    uint64_t lastEventSeq{ 0 };
  };

  explicit ConsensusNode(const Clock &clock);
  ~ConsensusNode() override = default;

  // ----- accessors -----
  const Config &getConfig() const { return config_; }
  const std::string &getNodeId() const { return config_.engine.nodeId; }
  Status getStatus() const;
  EventHub &getEventHub() { return events_; }
  const Engine &getEngine() const { return engine_; }
  const consensus::MembershipRegistry &getRegistry() const {
    return registry_;
  }
  const TxPipeline &getPipeline() const { return pipeline_; }

  /**
   * Live or recently decided block, else a finalized block from the log
   */
  Roe<consensus::Block> getBlock(const std::string &blockHash) const;
  Roe<consensus::Node> getNode(const std::string &nodeId) const;
  Roe<TxPipeline::Record> getTransaction(const std::string &txId) const;

  /**
   * Replace the source of performance samples. nullptr restores vote
   * participation scoring. The source must outlive the node.
   */
  void setMetricsSource(MetricsSource *source);

  // ----- methods -----
  /**
   * Open the log, register genesis validators, recover the engine and mark
   * transactions of already finalized blocks as confirmed
   */
  Roe<void> init(const Config &config);

  /**
   * Liveness expiry, consensus timers and, as leader, the next proposal
   */
  void tick();

  Roe<consensus::Block> proposeBlock(const consensus::Block &block,
                                     std::optional<uint64_t> term = {});
  Roe<consensus::Block> voteOnBlock(const std::string &blockHash,
                                    const std::string &voterId, bool approve);

  Roe<TxPipeline::Receipt> submitTransaction(const consensus::Transaction &tx);
  Roe<TxPipeline::BatchResult>
  submitBatch(const std::vector<consensus::Transaction> &txs);

  Roe<consensus::Node> registerNode(const consensus::Node &node);
  Roe<consensus::Node> heartbeat(const std::string &nodeId);
  Roe<consensus::Node> slashNode(const std::string &nodeId,
                                 const std::string &reason);
  Roe<consensus::Node> setNodeStatus(const std::string &nodeId,
                                     consensus::NodeStatus status,
                                     const std::string &reason);

  Engine::VoteResponse handleVoteRequest(const Engine::VoteRequest &request);
  void handleVoteResponse(const Engine::VoteResponse &response);
  Roe<void> handleLeaderHeartbeat(uint64_t term, const std::string &leaderId);

  /**
   * A peer answered one of our messages
   */
  void handlePeerAck(uint64_t term, const std::string &nodeId);

  // ----- ConsensusEngine::Delegate -----
  void onEvent(const consensus::ConsensusEvent &event) override;
  void onBlockFinalized(const consensus::Block &block) override;
  void onBlockAborted(const consensus::Block &block) override;
  void broadcastProposal(const consensus::Block &block) override;
  void broadcastVote(const consensus::Vote &vote) override;
  void requestVotes(const Engine::VoteRequest &request) override;
  void sendHeartbeat(uint64_t term, uint64_t finalizedHeight) override;

private:
  Roe<void> restoreFromLog();
  void proposeNextBatch();
  void autoVote(const consensus::Block &block);
  void updatePerformance(const consensus::Block &block);
  void noteLiveness(const std::string &nodeId);
  void recordValidatorSet();

  // Voters of the last finalized block, scored when the next one finalizes
  struct Round {
    std::string blockHash;
    std::set<std::string> expected;
    std::set<std::string> voters;
  };

  const Clock &clock_;
  Config config_;
  LogStore logStore_;
  consensus::MembershipRegistry registry_;
  Engine engine_;
  TxPipeline pipeline_;
  EventHub events_;
  ParticipationMetrics participation_;
  MetricsSource *metrics_{ nullptr };
  std::string inFlightHash_; // our own proposal awaiting a decision
  std::optional<Round> lastRound_;
};

std::ostream &operator<<(std::ostream &os, const ConsensusNode::Config &config);

} // namespace hr

#endif // HR_CONSENSUS_NODE_H
