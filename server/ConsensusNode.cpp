#include "ConsensusNode.h"
#include "../lib/BinaryPack.hpp"

namespace hr {

using consensus::Block;
using consensus::BlockState;
using consensus::Node;
using consensus::Role;
using consensus::Transaction;

ConsensusNode::ConsensusNode(const Clock &clock)
    : Module("server.node"), clock_(clock), engine_(logStore_, registry_, clock) {
  engine_.setDelegate(this);
}

void ConsensusNode::setMetricsSource(MetricsSource *source) {
  metrics_ = source;
}

ConsensusNode::Roe<void> ConsensusNode::init(const Config &config) {
  config_ = config;
  logStore_.redirectLogger(log().getFullName() + ".Log");
  registry_.redirectLogger(log().getFullName() + ".Registry");
  engine_.redirectLogger(log().getFullName() + ".Engine");
  pipeline_.redirectLogger(log().getFullName() + ".Pipeline");

  auto opened = logStore_.init(LogStore::Config{ config_.workDir });
  if (!opened) {
    return Error(ErrorKind::INTERNAL,
                 "Failed to open log: " + opened.error().message);
  }

  registry_.init(config_.registry);
  int64_t now = clock_.nowMs();
  for (const auto &node : config_.validators) {
    auto registered = registry_.registerNode(node, now);
    if (!registered) {
      return Error(registered.error().code, "Genesis validator '" +
                                                node.nodeId + "': " +
                                                registered.error().message);
    }
  }

  pipeline_.init(config_.pipeline);
  auto restored = restoreFromLog();
  if (!restored) {
    return restored;
  }

  auto started = engine_.init(config_.engine);
  if (!started) {
    return started;
  }
  recordValidatorSet();

  log().info << "Node " << getNodeId() << " ready: term " << engine_.getTerm()
             << ", finalized height " << engine_.getLastFinalizedHeight()
             << ", " << registry_.getNodeCount() << " known nodes";
  return {};
}

ConsensusNode::Roe<void> ConsensusNode::restoreFromLog() {
  size_t blocks = 0;
  size_t transactions = 0;
  for (uint64_t index = 1; index <= logStore_.lastIndex(); ++index) {
    auto entry = logStore_.read(index);
    if (!entry) {
      return Error(ErrorKind::INTERNAL, entry.error().message);
    }
    if (entry->type != LogEntry::Type::BLOCK) {
      continue;
    }
    auto block = utl::binaryUnpack<Block>(entry->payload);
    if (!block) {
      return Error(ErrorKind::INTERNAL,
                   "Corrupt block at log index " + std::to_string(index) +
                       ": " + block.error().message);
    }
    pipeline_.restoreConfirmed(*block);
    ++blocks;
    transactions += block->transactions.size();
  }
  if (blocks > 0) {
    log().info << "Restored " << transactions << " confirmed transactions from "
               << blocks << " finalized blocks";
  }
  return {};
}

// ----- accessors -----

ConsensusNode::Status ConsensusNode::getStatus() const {
  Status status;
  status.nodeId = getNodeId();
  status.consensus = engine_.getStatus();
  status.pendingTransactions = pipeline_.getPendingCount();
  status.knownNodes = registry_.getNodeCount();
  status.logSize = logStore_.size();
  status.lastEventSeq = events_.getLastSeq();
  return status;
}

ConsensusNode::Roe<Block> ConsensusNode::getBlock(const std::string &blockHash) const {
  auto block = engine_.getBlock(blockHash);
  if (block || block.error().code != ErrorKind::BLOCK_NOT_FOUND) {
    return block;
  }

  for (uint64_t index = logStore_.lastIndex(); index > 0; --index) {
    auto entry = logStore_.read(index);
    if (!entry || entry->type != LogEntry::Type::BLOCK) {
      continue;
    }
    auto stored = utl::binaryUnpack<Block>(entry->payload);
    if (stored && stored->hash == blockHash) {
      return *stored;
    }
  }
  return block;
}

ConsensusNode::Roe<Node> ConsensusNode::getNode(const std::string &nodeId) const {
  return registry_.getNode(nodeId);
}

ConsensusNode::Roe<TxPipeline::Record>
ConsensusNode::getTransaction(const std::string &txId) const {
  return pipeline_.getRecord(txId);
}

// ----- timers -----

void ConsensusNode::tick() {
  int64_t now = clock_.nowMs();
  noteLiveness(getNodeId());
  auto expired = registry_.expireStale(now);
  if (!expired.empty()) {
    log().warning << expired.size() << " nodes lost liveness";
  }
  recordValidatorSet();
  engine_.tick();
  proposeNextBatch();
}

void ConsensusNode::proposeNextBatch() {
  if (engine_.getRole() != Role::LEADER) {
    return;
  }
  if (!inFlightHash_.empty()) {
    auto open = engine_.getBlock(inFlightHash_);
    if (open && (open->state == BlockState::PENDING ||
                 open->state == BlockState::BUFFERED)) {
      return;
    }
    inFlightHash_.clear();
  }

  int64_t now = clock_.nowMs();
  auto txs = pipeline_.takeBatch(now);
  if (txs.empty()) {
    return;
  }

  Block block;
  block.height = engine_.getLastFinalizedHeight() + 1;
  block.previousHash = engine_.getLastFinalizedHash();
  block.timestamp = now;
  block.validator = getNodeId();
  block.transactions = std::move(txs);
  block.hash = block.computeHash();

  auto ids = block.transactionIds();
  pipeline_.markIncluded(ids, block.hash, block.height);
  inFlightHash_ = block.hash;

  log().info << "Proposing " << ids.size() << " transactions at height "
             << block.height;
  auto proposed = proposeBlock(block, engine_.getTerm());
  if (!proposed) {
    log().error << "Own proposal refused: " << proposed.error().message;
    if (inFlightHash_ == block.hash) {
      inFlightHash_.clear();
    }
    pipeline_.onAborted(ids, proposed.error().message);
  }
}

// ----- requests -----

ConsensusNode::Roe<Block> ConsensusNode::proposeBlock(const Block &block,
                                       std::optional<uint64_t> term) {
  noteLiveness(block.validator);
  auto proposed = engine_.proposeBlock(block, term);
  if (!proposed) {
    return proposed;
  }
  autoVote(*proposed);
  return engine_.getBlock(proposed->hash);
}

void ConsensusNode::autoVote(const Block &block) {
  if (!config_.autoVote || block.votes.count(getNodeId()) > 0) {
    return;
  }
  if (!registry_.isEligibleForConsensus(getNodeId())) {
    return;
  }
  auto voted = engine_.voteOnBlock(block.hash, getNodeId(), true);
  if (!voted) {
    log().warning << "Could not vote on " << block.hash << ": "
                  << voted.error().message;
  }
}

ConsensusNode::Roe<Block> ConsensusNode::voteOnBlock(const std::string &blockHash,
                                      const std::string &voterId,
                                      bool approve) {
  noteLiveness(voterId);
  auto voted = engine_.voteOnBlock(blockHash, voterId, approve);
  if (!voted && lastRound_ && lastRound_->blockHash == blockHash &&
      registry_.isEligibleForConsensus(voterId)) {
    // Late vote on the block that just finalized still counts as taking part
    lastRound_->voters.insert(voterId);
  }
  return voted;
}

ConsensusNode::Roe<TxPipeline::Receipt>
ConsensusNode::submitTransaction(const Transaction &tx) {
  return pipeline_.submit(tx, clock_.nowMs());
}

ConsensusNode::Roe<TxPipeline::BatchResult>
ConsensusNode::submitBatch(const std::vector<Transaction> &txs) {
  return pipeline_.submitBatch(txs, clock_.nowMs());
}

ConsensusNode::Roe<Node> ConsensusNode::registerNode(const Node &node) {
  auto registered = registry_.registerNode(node, clock_.nowMs());
  if (!registered) {
    return registered.error();
  }
  recordValidatorSet();
  return registry_.getNode(node.nodeId);
}

ConsensusNode::Roe<Node> ConsensusNode::heartbeat(const std::string &nodeId) {
  auto alive = registry_.heartbeat(nodeId, clock_.nowMs());
  if (!alive) {
    return alive.error();
  }
  recordValidatorSet();
  return registry_.getNode(nodeId);
}

ConsensusNode::Roe<Node> ConsensusNode::slashNode(const std::string &nodeId,
                                   const std::string &reason) {
  auto slashed = registry_.addSlash(nodeId, reason, clock_.nowMs());
  if (!slashed) {
    return slashed.error();
  }
  recordValidatorSet();
  return registry_.getNode(nodeId);
}

ConsensusNode::Roe<Node> ConsensusNode::setNodeStatus(const std::string &nodeId,
                                       consensus::NodeStatus status,
                                       const std::string &reason) {
  auto changed = registry_.setStatus(nodeId, status, reason, clock_.nowMs());
  if (!changed) {
    return changed.error();
  }
  recordValidatorSet();
  return registry_.getNode(nodeId);
}

ConsensusNode::Engine::VoteResponse
ConsensusNode::handleVoteRequest(const Engine::VoteRequest &request) {
  noteLiveness(request.candidateId);
  return engine_.handleVoteRequest(request);
}

void ConsensusNode::handleVoteResponse(const Engine::VoteResponse &response) {
  noteLiveness(response.voterId);
  engine_.handleVoteResponse(response);
}

ConsensusNode::Roe<void> ConsensusNode::handleLeaderHeartbeat(uint64_t term,
                                               const std::string &leaderId) {
  noteLiveness(leaderId);
  return engine_.handleHeartbeat(term, leaderId);
}

void ConsensusNode::handlePeerAck(uint64_t term, const std::string &nodeId) {
  noteLiveness(nodeId);
  engine_.observeTerm(term);
}

void ConsensusNode::noteLiveness(const std::string &nodeId) {
  if (nodeId.empty() || !registry_.hasNode(nodeId)) {
    return;
  }
  auto alive = registry_.heartbeat(nodeId, clock_.nowMs());
  if (!alive) {
    log().debug << "Liveness of " << nodeId << ": " << alive.error().message;
  }
}

void ConsensusNode::recordValidatorSet() {
  auto recorded = engine_.recordValidatorSet();
  if (!recorded) {
    log().error << recorded.error().message;
  }
}

// ----- ConsensusEngine::Delegate -----

void ConsensusNode::onEvent(const consensus::ConsensusEvent &event) {
  events_.publish(event);
}

void ConsensusNode::onBlockFinalized(const Block &block) {
  pipeline_.onFinalized(block);
  if (block.hash == inFlightHash_) {
    inFlightHash_.clear();
  }
  updatePerformance(block);

  if (config_.blockReward > 0 && registry_.hasNode(block.validator)) {
    auto rewarded =
        registry_.addReward(block.validator, config_.blockReward, clock_.nowMs());
    if (!rewarded) {
      log().warning << "Reward for " << block.validator << ": "
                    << rewarded.error().message;
    }
  }
}

void ConsensusNode::updatePerformance(const Block &block) {
  // Score the previous round now that its late votes had time to arrive
  if (lastRound_) {
    participation_.recordRound(lastRound_->expected, lastRound_->voters);
    MetricsSource *source = metrics_ ? metrics_ : &participation_;
    for (const auto &nodeId : lastRound_->expected) {
      auto sample = source->samplePerformance(nodeId);
      if (!sample) {
        continue;
      }
      auto score = registry_.updatePerformance(nodeId, *sample);
      if (!score) {
        log().warning << "Performance of " << nodeId << ": "
                      << score.error().message;
      }
    }
  }

  Round round;
  round.blockHash = block.hash;
  round.expected = registry_.getEligibleValidators();
  for (const auto &[voterId, approve] : block.votes) {
    round.voters.insert(voterId);
  }
  lastRound_ = std::move(round);
}

void ConsensusNode::onBlockAborted(const Block &block) {
  pipeline_.onAborted(block.transactionIds(), consensus::toString(block.state));
  if (block.hash == inFlightHash_) {
    inFlightHash_.clear();
  }
}

void ConsensusNode::broadcastProposal(const Block &block) {
  if (auto *transport = getDelegate<Transport>()) {
    transport->broadcastProposal(block);
  }
}

void ConsensusNode::broadcastVote(const consensus::Vote &vote) {
  if (auto *transport = getDelegate<Transport>()) {
    transport->broadcastVote(vote, engine_.getTerm());
  }
}

void ConsensusNode::requestVotes(const Engine::VoteRequest &request) {
  if (auto *transport = getDelegate<Transport>()) {
    transport->requestVotes(request);
  }
}

void ConsensusNode::sendHeartbeat(uint64_t term, uint64_t finalizedHeight) {
  if (auto *transport = getDelegate<Transport>()) {
    transport->sendHeartbeat(term, getNodeId(), finalizedHeight);
  }
}

std::ostream &operator<<(std::ostream &os, const ConsensusNode::Config &config) {
  os << "workDir=" << (config.workDir.empty() ? "(memory)" : config.workDir)
     << " " << config.engine << " validators=" << config.validators.size()
     << " autoVote=" << (config.autoVote ? "on" : "off")
     << " blockReward=" << config.blockReward;
  return os;
}

} // namespace hr
