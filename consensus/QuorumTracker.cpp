#include "QuorumTracker.h"

namespace hr {
namespace consensus {

bool QuorumTracker::hasBallot(const std::string &ballotId) const {
  return ballots_.count(ballotId) > 0;
}

std::map<std::string, bool>
QuorumTracker::getVotes(const std::string &ballotId) const {
  auto it = ballots_.find(ballotId);
  if (it == ballots_.end()) {
    return {};
  }
  return it->second;
}

double QuorumTracker::getConfidence(const std::string &ballotId) const {
  Tally tally = evaluate(ballotId);
  size_t counted = tally.approvals + tally.rejections;
  if (counted == 0) {
    return 0.0;
  }
  return static_cast<double>(tally.approvals) / static_cast<double>(counted);
}

QuorumTracker::Tally QuorumTracker::evaluate(const std::string &ballotId) const {
  Tally tally;
  tally.validators = validators_.size();
  tally.threshold = threshold(tally.validators);

  auto it = ballots_.find(ballotId);
  if (it != ballots_.end()) {
    for (const auto &[voterId, approve] : it->second) {
      if (validators_.count(voterId) == 0) {
        continue;
      }
      if (approve) {
        ++tally.approvals;
      } else {
        ++tally.rejections;
      }
    }
  }

  if (tally.validators == 0) {
    return tally;
  }
  if (tally.approvals >= tally.threshold) {
    tally.result = Result::ACCEPTED;
  } else if (tally.rejections + tally.threshold > tally.validators) {
    // Approvals can no longer reach the threshold
    tally.result = Result::REJECTED;
  }
  return tally;
}

void QuorumTracker::setValidators(const std::set<std::string> &validators) {
  validators_ = validators;
}

Roe<QuorumTracker::Tally> QuorumTracker::recordVote(const std::string &ballotId,
                                                    const std::string &voterId,
                                                    bool approve) {
  if (validators_.count(voterId) == 0) {
    return Error(ErrorKind::UNKNOWN_VOTER,
                 "Voter '" + voterId + "' is not in the validator set");
  }
  auto &votes = ballots_[ballotId];
  if (votes.count(voterId) > 0) {
    return Error(ErrorKind::DUPLICATE_VOTE, "Voter '" + voterId +
                                                "' already voted on " +
                                                ballotId);
  }
  votes[voterId] = approve;
  return evaluate(ballotId);
}

void QuorumTracker::erase(const std::string &ballotId) { ballots_.erase(ballotId); }

} // namespace consensus
} // namespace hr
