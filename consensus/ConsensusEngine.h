#pragma once

#include "Clock.h"
#include "Delegator.hpp"
#include "Errors.h"
#include "LogStore.h"
#include "MembershipRegistry.h"
#include "Module.h"
#include "QuorumTracker.h"
#include "Types.hpp"

#include <deque>
#include <map>
#include <optional>
#include <ostream>
#include <random>
#include <set>
#include <string>

namespace hr {
namespace consensus {

/**
 * ConsensusEngine - leader-based ordering with supermajority block finality.
 *
 * Roles follow Raft: followers become candidates after a randomized
 * election timeout, candidates win leadership with a majority of eligible
 * validators, any higher term forces a step down. The current leader
 * proposes blocks one height at a time; a block finalizes once
 * floor(2n/3) + 1 eligible validators approve it and is then appended to
 * the log. Proposals for later heights are buffered until their
 * predecessor finalizes.
 *
 * The engine is driven by a single writer: request handlers and tick()
 * must not run concurrently.
 */
class ConsensusEngine : public Module, public Delegator {
public:
  struct VoteRequest {
    uint64_t term{ 0 };
    std::string candidateId;
    uint64_t lastFinalizedHeight{ 0 };
    uint64_t lastLogTerm{ 0 };
  };

  struct VoteResponse {
    uint64_t term{ 0 };
    std::string voterId;
    bool granted{ false };
  };

  /**
   * Outbound effects. Broadcast callbacks only fire for messages that
   * originate on this node.
   */
  struct Delegate : Delegator::Delegate {
    virtual void onEvent(const ConsensusEvent &event) = 0;
    virtual void onBlockFinalized(const Block &block) = 0;
    // Block rejected by vote or expired without quorum
    virtual void onBlockAborted(const Block &block) = 0;
    virtual void broadcastProposal(const Block &block) = 0;
    virtual void broadcastVote(const Vote &vote) = 0;
    virtual void requestVotes(const VoteRequest &request) = 0;
    virtual void sendHeartbeat(uint64_t term, uint64_t finalizedHeight) = 0;
  };

  struct Config {
    std::string nodeId;
    std::string bootstrapLeader;
    int64_t electionTimeoutMinMs{ 150 };
    int64_t electionTimeoutMaxMs{ 300 };
    int64_t heartbeatIntervalMs{ 50 };
    int64_t roundTimeoutMs{ 5000 };
    size_t maxBufferedProposals{ 64 };
    bool verifyBlockHash{ false };
    uint64_t seed{ 0 }; // 0 seeds from std::random_device
  };

  struct Status {
    uint64_t currentRound{ 0 }; // next height to decide
    uint64_t term{ 0 };
    Role role{ Role::FOLLOWER };
    std::string leader;
    size_t activeValidators{ 0 };
    size_t requiredVotes{ 0 };
    double health{ 0.0 };
    uint64_t lastFinalizedHeight{ 0 };
    std::string lastFinalizedHash;
    size_t pendingBlocks{ 0 };
    size_t bufferedBlocks{ 0 };
  };

  // Decided blocks kept for lookup by hash
  constexpr static size_t MAX_DECIDED_BLOCKS = 1024;

  static double healthFor(size_t activeValidators);

  ConsensusEngine(LogStore &logStore, const MembershipRegistry &registry,
                  const Clock &clock);
  ~ConsensusEngine() override = default;

  // ----- accessors -----
  const Config &getConfig() const { return config_; }
  const std::string &getNodeId() const { return config_.nodeId; }
  Role getRole() const { return role_; }
  uint64_t getTerm() const { return term_; }
  const std::string &getLeader() const { return leader_; }
  uint64_t getLastFinalizedHeight() const { return lastFinalizedHeight_; }
  const std::string &getLastFinalizedHash() const { return lastFinalizedHash_; }
  int64_t getElectionDeadlineMs() const { return electionDeadlineMs_; }
  Status getStatus() const;
  Roe<Block> getBlock(const std::string &blockHash) const;

  // ----- methods -----
  /**
   * Apply config and recover term and finalized tip from the log
   */
  Roe<void> init(const Config &config);

  /**
   * Accept a block from the current leader. A supplied term must match
   * the current one (a higher term from an eligible validator is adopted
   * first). The block is Pending when it is the next height, Buffered when
   * it is further ahead.
   */
  Roe<Block> proposeBlock(Block block, std::optional<uint64_t> term = {});

  /**
   * Record a validator's vote and decide the block when quorum is reached
   * @return The block after the vote, with its updated state
   */
  Roe<Block> voteOnBlock(const std::string &blockHash,
                         const std::string &voterId, bool approve);

  /**
   * Drive timers: round expiry, elections and leader heartbeats
   */
  void tick();

  VoteResponse handleVoteRequest(const VoteRequest &request);
  void handleVoteResponse(const VoteResponse &response);
  Roe<void> handleHeartbeat(uint64_t term, const std::string &leaderId);

  // Step down when a peer reports a newer term
  void observeTerm(uint64_t term);

  /**
   * Append a CONFIG entry when the eligible validator set differs from the
   * last one recorded
   * @return true if an entry was appended
   */
  Roe<bool> recordValidatorSet();

private:
  struct LiveBlock {
    Block block;
    int64_t activatedAtMs{ 0 };
  };

  Roe<void> recoverFromLog();
  Roe<void> decide(const std::string &blockHash);
  Roe<void> finalize(LiveBlock &live);
  void abort(const std::string &blockHash, BlockState state,
             const std::string &reason);
  Roe<void> promoteBuffered();
  void expireOlderTerms();
  void startElection();
  void becomeLeader();
  void stepDown(uint64_t term, const std::string &leaderId);
  void resetElectionTimer();
  void refreshValidators();
  void remember(const Block &block);
  void emit(EventType type, const std::string &blockHash, uint64_t height,
            const std::string &nodeId, const std::string &message);
  std::optional<std::string> liveHashAt(uint64_t height) const;

  LogStore &logStore_;
  const MembershipRegistry &registry_;
  const Clock &clock_;
  Config config_;

  Role role_{ Role::FOLLOWER };
  uint64_t term_{ 1 };
  std::string votedFor_;
  std::string leader_;
  uint64_t lastFinalizedHeight_{ 0 };
  std::string lastFinalizedHash_;
  std::set<std::string> lastRecordedValidators_;

  int64_t electionDeadlineMs_{ 0 };
  int64_t lastHeartbeatSentMs_{ 0 };
  std::set<std::string> candidacyVotes_;
  std::mt19937_64 rng_;

  QuorumTracker tracker_{ QuorumTracker::Rule::SUPERMAJORITY };
  std::map<std::string, LiveBlock> live_;
  std::map<uint64_t, std::string> liveByHeight_;
  std::map<std::string, Block> decided_;
  std::deque<std::string> decidedOrder_;
};

std::ostream &operator<<(std::ostream &os,
                         const ConsensusEngine::Config &config);

} // namespace consensus
} // namespace hr
