#include "../QuorumTracker.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using namespace hr::consensus;

TEST(QuorumTrackerTest, Thresholds) {
  EXPECT_EQ(QuorumTracker::supermajorityThreshold(1), 1u);
  EXPECT_EQ(QuorumTracker::supermajorityThreshold(3), 3u);
  EXPECT_EQ(QuorumTracker::supermajorityThreshold(4), 3u);
  EXPECT_EQ(QuorumTracker::supermajorityThreshold(7), 5u);
  EXPECT_EQ(QuorumTracker::majorityThreshold(1), 1u);
  EXPECT_EQ(QuorumTracker::majorityThreshold(4), 3u);
  EXPECT_EQ(QuorumTracker::majorityThreshold(5), 3u);
}

TEST(QuorumTrackerTest, ThreeValidatorsNeedAllThree) {
  QuorumTracker tracker;
  tracker.setValidators({"A", "B", "C"});
  EXPECT_EQ(tracker.getThreshold(), 3u);

  auto t1 = tracker.recordVote("blk", "A", true);
  ASSERT_TRUE(t1.isOk());
  EXPECT_EQ(t1->result, QuorumTracker::Result::PENDING);
  auto t2 = tracker.recordVote("blk", "B", true);
  ASSERT_TRUE(t2.isOk());
  EXPECT_EQ(t2->result, QuorumTracker::Result::PENDING);
  auto t3 = tracker.recordVote("blk", "C", true);
  ASSERT_TRUE(t3.isOk());
  EXPECT_EQ(t3->result, QuorumTracker::Result::ACCEPTED);
  EXPECT_EQ(t3->approvals, 3u);
  EXPECT_DOUBLE_EQ(tracker.getConfidence("blk"), 1.0);
}

TEST(QuorumTrackerTest, SingleRejectionBlocksThreeValidatorQuorum) {
  QuorumTracker tracker;
  tracker.setValidators({"A", "B", "C"});
  ASSERT_TRUE(tracker.recordVote("blk", "A", true).isOk());
  auto tally = tracker.recordVote("blk", "B", false);
  ASSERT_TRUE(tally.isOk());
  EXPECT_EQ(tally->result, QuorumTracker::Result::REJECTED);
  EXPECT_DOUBLE_EQ(tracker.getConfidence("blk"), 0.5);
}

TEST(QuorumTrackerTest, OutcomeIndependentOfArrivalOrder) {
  std::vector<std::pair<std::string, bool>> votes = {
      {"A", true}, {"B", true}, {"C", false}, {"D", true}, {"E", true}};
  std::sort(votes.begin(), votes.end());

  do {
    QuorumTracker tracker;
    tracker.setValidators({"A", "B", "C", "D", "E"});
    for (const auto &[voter, approve] : votes) {
      tracker.recordVote("blk", voter, approve);
    }
    auto tally = tracker.evaluate("blk");
    EXPECT_EQ(tally.result, QuorumTracker::Result::ACCEPTED);
    EXPECT_EQ(tally.approvals, 4u);
    EXPECT_EQ(tally.rejections, 1u);
  } while (std::next_permutation(votes.begin(), votes.end()));
}

TEST(QuorumTrackerTest, DuplicateVoteKeepsFirst) {
  QuorumTracker tracker;
  tracker.setValidators({"A", "B", "C", "D"});
  ASSERT_TRUE(tracker.recordVote("blk", "A", true).isOk());

  auto again = tracker.recordVote("blk", "A", false);
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, ErrorKind::DUPLICATE_VOTE);

  auto votes = tracker.getVotes("blk");
  ASSERT_EQ(votes.size(), 1u);
  EXPECT_TRUE(votes["A"]);
}

TEST(QuorumTrackerTest, UnknownVoterRejected) {
  QuorumTracker tracker;
  tracker.setValidators({"A", "B"});
  auto result = tracker.recordVote("blk", "Z", true);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, ErrorKind::UNKNOWN_VOTER);
  EXPECT_FALSE(tracker.hasBallot("blk"));
}

TEST(QuorumTrackerTest, VotesOutsideCurrentSetDoNotCount) {
  QuorumTracker tracker;
  tracker.setValidators({"A", "B", "C", "D"});
  ASSERT_TRUE(tracker.recordVote("blk", "A", true).isOk());
  ASSERT_TRUE(tracker.recordVote("blk", "B", true).isOk());

  // D leaves the set; threshold for 3 becomes 3 and A's vote no longer counts
  tracker.setValidators({"B", "C", "E"});
  auto tally = tracker.evaluate("blk");
  EXPECT_EQ(tally.validators, 3u);
  EXPECT_EQ(tally.threshold, 3u);
  EXPECT_EQ(tally.approvals, 1u);
  EXPECT_EQ(tally.result, QuorumTracker::Result::PENDING);
}

TEST(QuorumTrackerTest, EmptyValidatorSetStaysPending) {
  QuorumTracker tracker;
  auto tally = tracker.evaluate("blk");
  EXPECT_EQ(tally.result, QuorumTracker::Result::PENDING);
  EXPECT_DOUBLE_EQ(tracker.getConfidence("blk"), 0.0);
}

TEST(QuorumTrackerTest, MajorityRule) {
  QuorumTracker tracker(QuorumTracker::Rule::MAJORITY);
  tracker.setValidators({"A", "B", "C"});
  ASSERT_TRUE(tracker.recordVote("term-2", "A", true).isOk());
  auto tally = tracker.recordVote("term-2", "B", true);
  ASSERT_TRUE(tally.isOk());
  EXPECT_EQ(tally->threshold, 2u);
  EXPECT_EQ(tally->result, QuorumTracker::Result::ACCEPTED);

  tracker.erase("term-2");
  EXPECT_FALSE(tracker.hasBallot("term-2"));
}
