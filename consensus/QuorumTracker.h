#pragma once

#include "Errors.h"

#include <cstddef>
#include <map>
#include <set>
#include <string>

namespace hr {
namespace consensus {

/**
 * QuorumTracker - tallies approve/reject votes per ballot.
 *
 * Only votes from the current validator set count, and the threshold is
 * computed from the size of that set at evaluation time. The outcome of a
 * ballot depends on its set of votes, never on their arrival order.
 */
class QuorumTracker {
public:
  enum class Rule {
    SUPERMAJORITY, // floor(2n/3) + 1, block finality
    MAJORITY,      // floor(n/2) + 1, leader candidacy
  };

  enum class Result { PENDING, ACCEPTED, REJECTED };

  struct Tally {
    size_t approvals{ 0 };
    size_t rejections{ 0 };
    size_t validators{ 0 };
    size_t threshold{ 0 };
    Result result{ Result::PENDING };
  };

  static size_t supermajorityThreshold(size_t n) { return (2 * n) / 3 + 1; }
  static size_t majorityThreshold(size_t n) { return n / 2 + 1; }

  explicit QuorumTracker(Rule rule = Rule::SUPERMAJORITY) : rule_(rule) {}

  // ----- accessors -----
  size_t getThreshold() const { return threshold(validators_.size()); }
  const std::set<std::string> &getValidators() const { return validators_; }
  bool hasBallot(const std::string &ballotId) const;
  std::map<std::string, bool> getVotes(const std::string &ballotId) const;

  /**
   * Approvals over counted votes, 0 when no vote counts yet
   */
  double getConfidence(const std::string &ballotId) const;
  Tally evaluate(const std::string &ballotId) const;

  // ----- methods -----
  void setValidators(const std::set<std::string> &validators);

  /**
   * Record one vote. A voter outside the validator set is UNKNOWN_VOTER, a
   * second vote by the same voter is DUPLICATE_VOTE and the first vote stays.
   */
  Roe<Tally> recordVote(const std::string &ballotId, const std::string &voterId,
                        bool approve);
  void erase(const std::string &ballotId);
  void clear() { ballots_.clear(); }

private:
  size_t threshold(size_t n) const {
    return rule_ == Rule::SUPERMAJORITY ? supermajorityThreshold(n)
                                        : majorityThreshold(n);
  }

  Rule rule_;
  std::set<std::string> validators_;
  std::map<std::string, std::map<std::string, bool>> ballots_;
};

} // namespace consensus
} // namespace hr
