#include "ConsensusEngine.h"
#include "BinaryPack.hpp"
#include "Validation.h"

#include <algorithm>
#include <vector>

namespace hr {
namespace consensus {

double ConsensusEngine::healthFor(size_t activeValidators) {
  if (activeValidators >= 3) {
    return 1.0;
  }
  if (activeValidators == 2) {
    return 0.7;
  }
  if (activeValidators == 1) {
    return 0.3;
  }
  return 0.0;
}

ConsensusEngine::ConsensusEngine(LogStore &logStore,
                                 const MembershipRegistry &registry,
                                 const Clock &clock)
    : Module("consensus.engine"), logStore_(logStore), registry_(registry),
      clock_(clock) {}

Roe<void> ConsensusEngine::init(const Config &config) {
  if (config.nodeId.empty()) {
    return Error(ErrorKind::VALIDATION, "nodeId: must not be empty");
  }
  if (config.electionTimeoutMinMs <= 0 ||
      config.electionTimeoutMaxMs < config.electionTimeoutMinMs) {
    return Error(ErrorKind::VALIDATION,
                 "electionTimeout: need 0 < min <= max");
  }
  if (config.heartbeatIntervalMs <= 0 || config.roundTimeoutMs <= 0) {
    return Error(ErrorKind::VALIDATION,
                 "heartbeatIntervalMs and roundTimeoutMs must be positive");
  }
  config_ = config;
  rng_.seed(config_.seed != 0 ? config_.seed : std::random_device{}());

  auto recovered = recoverFromLog();
  if (!recovered) {
    return recovered;
  }

  term_ = std::max<uint64_t>(1, logStore_.lastTerm());
  votedFor_.clear();
  candidacyVotes_.clear();
  int64_t now = clock_.nowMs();
  if (!config_.bootstrapLeader.empty() &&
      config_.bootstrapLeader == config_.nodeId) {
    role_ = Role::LEADER;
    leader_ = config_.nodeId;
    votedFor_ = config_.nodeId;
    lastHeartbeatSentMs_ = now - config_.heartbeatIntervalMs;
  } else {
    role_ = Role::FOLLOWER;
    leader_ = config_.bootstrapLeader;
  }
  resetElectionTimer();

  log().info << "Initialized " << toString(role_) << " at term " << term_
             << ", finalized height " << lastFinalizedHeight_ << " (" << config_
             << ")";
  return {};
}

Roe<void> ConsensusEngine::recoverFromLog() {
  lastFinalizedHeight_ = 0;
  lastFinalizedHash_.clear();
  lastRecordedValidators_.clear();

  bool haveBlock = false;
  bool haveConfig = false;
  for (uint64_t index = logStore_.lastIndex(); index > 0; --index) {
    if (haveBlock && haveConfig) {
      break;
    }
    auto entry = logStore_.read(index);
    if (!entry) {
      return Error(ErrorKind::INTERNAL, entry.error().message);
    }
    if (entry->type == LogEntry::Type::BLOCK && !haveBlock) {
      auto block = utl::binaryUnpack<Block>(entry->payload);
      if (!block) {
        return Error(ErrorKind::INTERNAL, "Corrupt block at log index " +
                                              std::to_string(index));
      }
      lastFinalizedHeight_ = block->height;
      lastFinalizedHash_ = block->hash;
      haveBlock = true;
    } else if (entry->type == LogEntry::Type::CONFIG && !haveConfig) {
      auto change = utl::binaryUnpack<ConfigChange>(entry->payload);
      if (!change) {
        return Error(ErrorKind::INTERNAL, "Corrupt config at log index " +
                                              std::to_string(index));
      }
      lastRecordedValidators_.insert(change->validators.begin(),
                                     change->validators.end());
      haveConfig = true;
    }
  }
  return {};
}

// ----- accessors -----

ConsensusEngine::Status ConsensusEngine::getStatus() const {
  Status status;
  status.currentRound = lastFinalizedHeight_ + 1;
  status.term = term_;
  status.role = role_;
  status.leader = leader_;
  status.activeValidators = registry_.getEligibleValidators().size();
  status.requiredVotes =
      QuorumTracker::supermajorityThreshold(status.activeValidators);
  status.health = healthFor(status.activeValidators);
  status.lastFinalizedHeight = lastFinalizedHeight_;
  status.lastFinalizedHash = lastFinalizedHash_;
  for (const auto &[hash, live] : live_) {
    if (live.block.state == BlockState::PENDING) {
      ++status.pendingBlocks;
    } else {
      ++status.bufferedBlocks;
    }
  }
  return status;
}

Roe<Block> ConsensusEngine::getBlock(const std::string &blockHash) const {
  auto it = live_.find(blockHash);
  if (it != live_.end()) {
    return it->second.block;
  }
  auto decided = decided_.find(blockHash);
  if (decided != decided_.end()) {
    return decided->second;
  }
  return Error(ErrorKind::BLOCK_NOT_FOUND, "Unknown block: " + blockHash);
}

std::optional<std::string> ConsensusEngine::liveHashAt(uint64_t height) const {
  auto it = liveByHeight_.find(height);
  if (it == liveByHeight_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// ----- proposals and votes -----

Roe<Block> ConsensusEngine::proposeBlock(Block block,
                                         std::optional<uint64_t> term) {
  if (term) {
    if (*term < term_) {
      return Error(ErrorKind::STALE_TERM, "Proposal term " +
                                              std::to_string(*term) +
                                              " is behind current term " +
                                              std::to_string(term_));
    }
    if (*term > term_) {
      if (!registry_.isEligibleForConsensus(block.validator)) {
        return Error(ErrorKind::NOT_LEADER, "Proposer '" + block.validator +
                                                "' is not an eligible validator");
      }
      stepDown(*term, block.validator);
    }
  }

  if (leader_.empty() || block.validator != leader_) {
    return Error(ErrorKind::NOT_LEADER,
                 "Proposer '" + block.validator +
                     "' is not the current leader" +
                     (leader_.empty() ? std::string(" (no known leader)")
                                      : " (leader is '" + leader_ + "')"));
  }

  auto structure = checkBlockStructure(block);
  if (!structure) {
    return structure.error();
  }
  if (config_.verifyBlockHash && block.hash != block.computeHash()) {
    Error error(ErrorKind::VALIDATION, "hash: does not match block contents");
    error.field = "hash";
    return error;
  }
  if (block.height <= lastFinalizedHeight_) {
    return Error(ErrorKind::VALIDATION, "height: " +
                                            std::to_string(block.height) +
                                            " is already finalized");
  }
  if (live_.count(block.hash) > 0 || decided_.count(block.hash) > 0) {
    return Error(ErrorKind::VALIDATION,
                 "hash: block " + block.hash + " was already proposed");
  }
  if (liveHashAt(block.height)) {
    return Error(ErrorKind::VALIDATION, "height: " +
                                            std::to_string(block.height) +
                                            " already has an open proposal");
  }

  block.term = term_;
  block.votes.clear();
  block.confidenceScore = 0.0;

  if (block.height == lastFinalizedHeight_ + 1) {
    if (lastFinalizedHeight_ > 0 && block.previousHash != lastFinalizedHash_) {
      Error error(ErrorKind::VALIDATION,
                  "previousHash: does not match finalized block " +
                      lastFinalizedHash_);
      error.field = "previousHash";
      return error;
    }
    block.state = BlockState::PENDING;
  } else {
    size_t buffered = std::count_if(live_.begin(), live_.end(), [](const auto &p) {
      return p.second.block.state == BlockState::BUFFERED;
    });
    if (buffered >= config_.maxBufferedProposals) {
      return Error(ErrorKind::BUFFER_FULL,
                   "Proposal buffer is full (" + std::to_string(buffered) +
                       " blocks ahead of height " +
                       std::to_string(lastFinalizedHeight_ + 1) + ")");
    }
    block.state = BlockState::BUFFERED;
  }

  live_[block.hash] = LiveBlock{block, clock_.nowMs()};
  liveByHeight_[block.height] = block.hash;

  log().info << "Accepted proposal " << block.hash << " at height "
             << block.height << " (" << toString(block.state) << ", "
             << block.transactions.size() << " txs)";
  emit(EventType::BLOCK_PROPOSED, block.hash, block.height, block.validator,
       toString(block.state));

  if (block.validator == config_.nodeId) {
    if (auto *delegate = getDelegate<Delegate>()) {
      delegate->broadcastProposal(block);
    }
  }
  return block;
}

Roe<Block> ConsensusEngine::voteOnBlock(const std::string &blockHash,
                                        const std::string &voterId,
                                        bool approve) {
  if (!registry_.hasNode(voterId)) {
    return Error(ErrorKind::UNKNOWN_VOTER, "Unknown voter: " + voterId);
  }
  if (!registry_.isEligibleForConsensus(voterId)) {
    return Error(ErrorKind::UNKNOWN_VOTER,
                 "Voter '" + voterId + "' is not an eligible validator");
  }

  auto it = live_.find(blockHash);
  if (it == live_.end()) {
    auto decided = decided_.find(blockHash);
    if (decided != decided_.end()) {
      return Error(ErrorKind::VALIDATION,
                   "Block " + blockHash + " is already " +
                       toString(decided->second.state));
    }
    return Error(ErrorKind::BLOCK_NOT_FOUND, "Unknown block: " + blockHash);
  }

  refreshValidators();
  auto tally = tracker_.recordVote(blockHash, voterId, approve);
  if (!tally) {
    return tally.error();
  }

  Block &block = it->second.block;
  block.votes[voterId] = approve;
  block.confidenceScore = tracker_.getConfidence(blockHash);
  log().debug << voterId << (approve ? " approved " : " rejected ") << blockHash
              << " (" << tally->approvals << "/" << tally->threshold << ")";

  if (voterId == config_.nodeId) {
    if (auto *delegate = getDelegate<Delegate>()) {
      delegate->broadcastVote(Vote{blockHash, voterId, approve});
    }
  }

  if (block.state == BlockState::PENDING) {
    auto decided = decide(blockHash);
    if (!decided) {
      return decided.error();
    }
    auto promoted = promoteBuffered();
    if (!promoted) {
      return promoted.error();
    }
  }
  return getBlock(blockHash);
}

Roe<void> ConsensusEngine::decide(const std::string &blockHash) {
  auto it = live_.find(blockHash);
  if (it == live_.end() || it->second.block.state != BlockState::PENDING) {
    return {};
  }

  refreshValidators();
  auto tally = tracker_.evaluate(blockHash);
  switch (tally.result) {
  case QuorumTracker::Result::ACCEPTED:
    return finalize(it->second);
  case QuorumTracker::Result::REJECTED:
    abort(blockHash, BlockState::REJECTED,
          std::to_string(tally.rejections) + " of " +
              std::to_string(tally.validators) + " validators rejected");
    return {};
  case QuorumTracker::Result::PENDING:
    break;
  }
  return {};
}

Roe<void> ConsensusEngine::finalize(LiveBlock &live) {
  Block block = live.block;
  block.state = BlockState::FINALIZED;

  LogEntry entry;
  entry.term = term_;
  entry.type = LogEntry::Type::BLOCK;
  entry.payload = utl::binaryPack(block);
  entry.committed = true;

  auto appended = logStore_.append(entry);
  if (!appended) {
    std::string reason = "log append failed: " + appended.error().message;
    log().error << "Cannot finalize " << block.hash << ": " << reason;
    abort(block.hash, BlockState::EXPIRED, reason);
    if (role_ == Role::LEADER) {
      stepDown(term_, "");
    }
    return Error(ErrorKind::INTERNAL, reason);
  }

  lastFinalizedHeight_ = block.height;
  lastFinalizedHash_ = block.hash;
  live_.erase(block.hash);
  liveByHeight_.erase(block.height);
  tracker_.erase(block.hash);
  remember(block);

  log().info << "Finalized " << block.hash << " at height " << block.height
             << " as log entry " << *appended << " (confidence "
             << block.confidenceScore << ")";
  emit(EventType::BLOCK_ACCEPTED, block.hash, block.height, block.validator,
       "log index " + std::to_string(*appended));
  if (auto *delegate = getDelegate<Delegate>()) {
    delegate->onBlockFinalized(block);
  }
  return {};
}

void ConsensusEngine::abort(const std::string &blockHash, BlockState state,
                            const std::string &reason) {
  auto it = live_.find(blockHash);
  if (it == live_.end()) {
    return;
  }
  Block block = it->second.block;
  block.state = state;
  live_.erase(it);
  liveByHeight_.erase(block.height);
  tracker_.erase(blockHash);
  remember(block);

  log().warning << "Block " << blockHash << " at height " << block.height
                << " " << toString(state) << ": " << reason;
  emit(state == BlockState::REJECTED ? EventType::BLOCK_REJECTED
                                     : EventType::BLOCK_EXPIRED,
       blockHash, block.height, block.validator, reason);
  if (auto *delegate = getDelegate<Delegate>()) {
    delegate->onBlockAborted(block);
  }
}

Roe<void> ConsensusEngine::promoteBuffered() {
  while (true) {
    auto next = liveHashAt(lastFinalizedHeight_ + 1);
    if (!next) {
      return {};
    }
    LiveBlock &live = live_[*next];
    if (live.block.state != BlockState::BUFFERED) {
      return {};
    }
    if (live.block.previousHash != lastFinalizedHash_) {
      abort(*next, BlockState::REJECTED,
            "previousHash does not match finalized block " + lastFinalizedHash_);
      return {};
    }

    live.block.state = BlockState::PENDING;
    live.activatedAtMs = clock_.nowMs();
    log().debug << "Promoted buffered block " << *next << " at height "
                << live.block.height;

    uint64_t before = lastFinalizedHeight_;
    auto decided = decide(*next);
    if (!decided) {
      return decided;
    }
    if (lastFinalizedHeight_ == before) {
      return {};
    }
  }
}

void ConsensusEngine::remember(const Block &block) {
  if (decided_.count(block.hash) == 0) {
    decidedOrder_.push_back(block.hash);
  }
  decided_[block.hash] = block;
  while (decidedOrder_.size() > MAX_DECIDED_BLOCKS) {
    decided_.erase(decidedOrder_.front());
    decidedOrder_.pop_front();
  }
}

void ConsensusEngine::refreshValidators() {
  tracker_.setValidators(registry_.getEligibleValidators());
}

// ----- timers -----

void ConsensusEngine::tick() {
  int64_t now = clock_.nowMs();

  std::vector<std::string> pending;
  for (const auto &[hash, live] : live_) {
    if (live.block.state == BlockState::PENDING) {
      pending.push_back(hash);
    }
  }
  for (const auto &hash : pending) {
    // Membership changes can decide a block without a new vote
    auto decided = decide(hash);
    if (!decided) {
      log().error << decided.error().message;
      continue;
    }
    auto it = live_.find(hash);
    if (it != live_.end() &&
        now - it->second.activatedAtMs >= config_.roundTimeoutMs) {
      abort(hash, BlockState::EXPIRED,
            "no quorum within " + std::to_string(config_.roundTimeoutMs) +
                " ms");
    }
  }
  auto promoted = promoteBuffered();
  if (!promoted) {
    log().error << promoted.error().message;
  }

  if (role_ == Role::LEADER) {
    if (!registry_.isEligibleForConsensus(config_.nodeId)) {
      log().warning << "No longer an eligible validator, stepping down";
      stepDown(term_, "");
      return;
    }
    if (now - lastHeartbeatSentMs_ >= config_.heartbeatIntervalMs) {
      lastHeartbeatSentMs_ = now;
      if (auto *delegate = getDelegate<Delegate>()) {
        delegate->sendHeartbeat(term_, lastFinalizedHeight_);
      }
      emit(EventType::HEARTBEAT, "", lastFinalizedHeight_, config_.nodeId, "");
    }
    return;
  }

  if (now >= electionDeadlineMs_) {
    if (registry_.isEligibleForConsensus(config_.nodeId)) {
      startElection();
    } else {
      resetElectionTimer();
    }
  }
}

void ConsensusEngine::resetElectionTimer() {
  std::uniform_int_distribution<int64_t> jitter(config_.electionTimeoutMinMs,
                                                config_.electionTimeoutMaxMs);
  electionDeadlineMs_ = clock_.nowMs() + jitter(rng_);
}

// ----- elections -----

void ConsensusEngine::startElection() {
  term_ += 1;
  role_ = Role::CANDIDATE;
  votedFor_ = config_.nodeId;
  leader_.clear();
  candidacyVotes_ = {config_.nodeId};
  expireOlderTerms();
  resetElectionTimer();

  log().info << "Starting election for term " << term_;
  emit(EventType::ELECTION_STARTED, "", lastFinalizedHeight_, config_.nodeId,
       "");
  if (auto *delegate = getDelegate<Delegate>()) {
    delegate->requestVotes(VoteRequest{term_, config_.nodeId,
                                       lastFinalizedHeight_,
                                       logStore_.lastTerm()});
  }

  // A single validator elects itself
  handleVoteResponse(VoteResponse{term_, config_.nodeId, true});
}

void ConsensusEngine::becomeLeader() {
  role_ = Role::LEADER;
  leader_ = config_.nodeId;
  candidacyVotes_.clear();
  log().info << "Elected leader for term " << term_;
  emit(EventType::LEADER_ELECTED, "", lastFinalizedHeight_, config_.nodeId, "");

  lastHeartbeatSentMs_ = clock_.nowMs();
  if (auto *delegate = getDelegate<Delegate>()) {
    delegate->sendHeartbeat(term_, lastFinalizedHeight_);
  }
}

void ConsensusEngine::stepDown(uint64_t term, const std::string &leaderId) {
  bool termChanged = term > term_;
  if (termChanged) {
    term_ = term;
    votedFor_.clear();
  }

  Role previous = role_;
  std::string previousLeader = leader_;
  role_ = Role::FOLLOWER;
  leader_ = leaderId;
  candidacyVotes_.clear();

  if (previous != Role::FOLLOWER) {
    log().info << "Stepping down from " << toString(previous) << " at term "
               << term_;
    emit(EventType::STEPPED_DOWN, "", lastFinalizedHeight_, config_.nodeId,
         toString(previous));
  }
  if (!leaderId.empty() && leaderId != previousLeader) {
    log().info << "Following " << leaderId << " at term " << term_;
    emit(EventType::LEADER_ELECTED, "", lastFinalizedHeight_, leaderId, "");
  }
  if (termChanged) {
    expireOlderTerms();
  }
  resetElectionTimer();
}

void ConsensusEngine::expireOlderTerms() {
  std::vector<std::string> stale;
  for (const auto &[hash, live] : live_) {
    if (live.block.term < term_) {
      stale.push_back(hash);
    }
  }
  for (const auto &hash : stale) {
    abort(hash, BlockState::EXPIRED,
          "superseded by term " + std::to_string(term_));
  }
}

ConsensusEngine::VoteResponse
ConsensusEngine::handleVoteRequest(const VoteRequest &request) {
  VoteResponse response{term_, config_.nodeId, false};
  if (request.term < term_) {
    return response;
  }
  if (request.term > term_) {
    stepDown(request.term, "");
  }
  response.term = term_;

  if (!registry_.isEligibleForConsensus(request.candidateId)) {
    log().debug << "Denied vote to ineligible candidate "
                << request.candidateId;
    return response;
  }

  uint64_t myLastTerm = logStore_.lastTerm();
  bool upToDate = request.lastLogTerm > myLastTerm ||
                  (request.lastLogTerm == myLastTerm &&
                   request.lastFinalizedHeight >= lastFinalizedHeight_);
  if ((votedFor_.empty() || votedFor_ == request.candidateId) && upToDate) {
    votedFor_ = request.candidateId;
    response.granted = true;
    resetElectionTimer();
  }
  log().debug << (response.granted ? "Granted" : "Denied") << " vote to "
              << request.candidateId << " for term " << request.term;
  return response;
}

void ConsensusEngine::handleVoteResponse(const VoteResponse &response) {
  if (response.term > term_) {
    stepDown(response.term, "");
    return;
  }
  if (role_ != Role::CANDIDATE || response.term != term_ || !response.granted) {
    return;
  }
  if (!registry_.isEligibleForConsensus(response.voterId)) {
    return;
  }
  candidacyVotes_.insert(response.voterId);

  auto eligible = registry_.getEligibleValidators();
  size_t votes = std::count_if(
      candidacyVotes_.begin(), candidacyVotes_.end(),
      [&eligible](const std::string &id) { return eligible.count(id) > 0; });
  if (votes >= QuorumTracker::majorityThreshold(eligible.size())) {
    becomeLeader();
  }
}

Roe<void> ConsensusEngine::handleHeartbeat(uint64_t term,
                                           const std::string &leaderId) {
  if (term < term_) {
    return Error(ErrorKind::STALE_TERM, "Heartbeat term " +
                                            std::to_string(term) +
                                            " is behind current term " +
                                            std::to_string(term_));
  }
  if (!registry_.isEligibleForConsensus(leaderId)) {
    return Error(ErrorKind::VALIDATION,
                 "Leader '" + leaderId + "' is not an eligible validator");
  }
  if (term == term_ && role_ == Role::LEADER && leaderId == config_.nodeId) {
    return {};
  }
  if (term == term_ && role_ == Role::LEADER && leaderId != config_.nodeId) {
    return Error(ErrorKind::VALIDATION, "Conflicting leader '" + leaderId +
                                            "' for term " +
                                            std::to_string(term));
  }

  if (term > term_ || role_ != Role::FOLLOWER || leader_ != leaderId) {
    stepDown(term, leaderId);
  } else {
    resetElectionTimer();
  }
  return {};
}

void ConsensusEngine::observeTerm(uint64_t term) {
  if (term > term_) {
    stepDown(term, "");
  }
}

Roe<bool> ConsensusEngine::recordValidatorSet() {
  auto current = registry_.getEligibleValidators();
  if (current == lastRecordedValidators_) {
    return false;
  }

  ConfigChange change;
  change.validators.assign(current.begin(), current.end());
  LogEntry entry;
  entry.term = term_;
  entry.type = LogEntry::Type::CONFIG;
  entry.payload = utl::binaryPack(change);
  entry.committed = true;

  auto appended = logStore_.append(entry);
  if (!appended) {
    return Error(ErrorKind::INTERNAL,
                 "Failed to record validator set: " + appended.error().message);
  }
  lastRecordedValidators_ = current;
  log().info << "Recorded validator set of " << current.size()
             << " at log index " << *appended;
  return true;
}

void ConsensusEngine::emit(EventType type, const std::string &blockHash,
                           uint64_t height, const std::string &nodeId,
                           const std::string &message) {
  ConsensusEvent event;
  event.type = type;
  event.term = term_;
  event.height = height;
  event.blockHash = blockHash;
  event.nodeId = nodeId;
  event.timestampMs = clock_.nowMs();
  event.message = message;
  if (auto *delegate = getDelegate<Delegate>()) {
    delegate->onEvent(event);
  }
}

std::ostream &operator<<(std::ostream &os,
                         const ConsensusEngine::Config &config) {
  os << "nodeId=" << config.nodeId
     << " bootstrapLeader=" << config.bootstrapLeader
     << " electionTimeoutMs=" << config.electionTimeoutMinMs << ".."
     << config.electionTimeoutMaxMs
     << " heartbeatIntervalMs=" << config.heartbeatIntervalMs
     << " roundTimeoutMs=" << config.roundTimeoutMs
     << " maxBufferedProposals=" << config.maxBufferedProposals;
  return os;
}

} // namespace consensus
} // namespace hr
