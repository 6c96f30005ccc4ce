#include "../RpcService.h"
#include "../JsonCodec.h"
#include <gtest/gtest.h>

using namespace hr;
using namespace hr::consensus;
using nlohmann::json;

namespace {

Node makeValidator(const std::string &id) {
  Node node;
  node.nodeId = id;
  node.type = NodeType::VALIDATOR;
  node.stake = 200000;
  return node;
}

json txJson(const std::string &id, double amount = 5) {
  return { { "id", id },
           { "from_address", "alice" },
           { "to_address", "bob" },
           { "amount", amount },
           { "timestamp", 1000 } };
}

} // namespace

class RpcServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    ConsensusNode::Config config;
    config.engine.nodeId = "B";
    config.engine.bootstrapLeader = "A";
    config.engine.seed = 3;
    config.autoVote = false;
    config.pipeline.maxBatchSize = 5;
    for (const auto &id : { "A", "B", "C" }) {
      config.validators.push_back(makeValidator(id));
    }
    ASSERT_TRUE(node_.init(config).isOk());
  }

  json call(const json &request) {
    return json::parse(rpc_.handleRequest(request.dump()));
  }

  json proposeFromA(uint64_t height = 1) {
    Block block;
    block.height = height;
    block.timestamp = 1000;
    block.validator = "A";
    block.hash = "block-" + std::to_string(height);
    return call({ { "type", "proposeBlock" }, { "block", codec::toJson(block) } });
  }

  json vote(const std::string &hash, const std::string &voter, bool approve) {
    return call({ { "type", "voteOnBlock" },
                  { "block_hash", hash },
                  { "voter_id", voter },
                  { "approve", approve } });
  }

  ManualClock clock_{ 1000 };
  ConsensusNode node_{ clock_ };
  RpcService rpc_{ node_ };
};

TEST_F(RpcServiceTest, MalformedRequestsAreValidationErrors) {
  auto garbage = json::parse(rpc_.handleRequest("{not json"));
  EXPECT_FALSE(garbage["ok"].get<bool>());
  EXPECT_EQ(garbage["status"], 400);
  EXPECT_EQ(garbage["error"]["kind"], "ValidationError");

  auto unknown = call({ { "type", "launchRockets" } });
  EXPECT_EQ(unknown["status"], 400);

  auto missing = call({ { "type", "voteOnBlock" }, { "block_hash", "x" } });
  EXPECT_EQ(missing["status"], 400);
  EXPECT_EQ(missing["error"]["field"], "voter_id");

  auto wrongType = call({ { "type", "voteOnBlock" },
                          { "block_hash", "x" },
                          { "voter_id", "A" },
                          { "approve", "yes" } });
  EXPECT_EQ(wrongType["error"]["field"], "approve");
}

TEST_F(RpcServiceTest, BlockFinalizesOnThirdApproval) {
  auto proposed = proposeFromA();
  ASSERT_TRUE(proposed["ok"].get<bool>()) << proposed.dump();
  EXPECT_EQ(proposed["status"], 200);
  EXPECT_TRUE(proposed["result"]["accepted"].get<bool>());
  EXPECT_EQ(proposed["result"]["block_hash"], "block-1");
  EXPECT_EQ(proposed["result"]["block"]["state"], "pending");

  EXPECT_EQ(vote("block-1", "A", true)["result"]["block"]["state"], "pending");
  EXPECT_EQ(vote("block-1", "B", true)["result"]["block"]["state"], "pending");
  auto last = vote("block-1", "C", true);
  ASSERT_TRUE(last["ok"].get<bool>());
  EXPECT_EQ(last["result"]["block"]["state"], "finalized");
  EXPECT_DOUBLE_EQ(last["result"]["block"]["confidence_score"].get<double>(),
                   1.0);

  auto status = call({ { "type", "getStatus" } });
  EXPECT_EQ(status["result"]["current_round"], 2);
  EXPECT_EQ(status["result"]["leader"], "A");
  EXPECT_EQ(status["result"]["active_validators"], 3);
  EXPECT_DOUBLE_EQ(status["result"]["health"].get<double>(), 1.0);

  auto block = call({ { "type", "getBlock" }, { "block_hash", "block-1" } });
  EXPECT_EQ(block["result"]["height"], 1);

  // Votes after the decision are refused
  EXPECT_EQ(vote("block-1", "C", true)["status"], 400);
}

TEST_F(RpcServiceTest, SecondVoteFromSameVoterIsDuplicate) {
  ASSERT_TRUE(proposeFromA()["ok"].get<bool>());
  ASSERT_TRUE(vote("block-1", "A", true)["ok"].get<bool>());
  auto again = vote("block-1", "A", false);
  EXPECT_FALSE(again["ok"].get<bool>());
  EXPECT_EQ(again["status"], 409);
  EXPECT_EQ(again["error"]["kind"], "DuplicateVoteError");

  auto block = call({ { "type", "getBlock" }, { "block_hash", "block-1" } });
  EXPECT_EQ(block["result"]["votes"]["A"], true);
}

TEST_F(RpcServiceTest, ProposalErrorsMapToStatusCodes) {
  Block block;
  block.height = 1;
  block.timestamp = 1000;
  block.validator = "C";
  block.hash = "h";
  auto notLeader =
      call({ { "type", "proposeBlock" }, { "block", codec::toJson(block) } });
  EXPECT_EQ(notLeader["status"], 409);
  EXPECT_EQ(notLeader["error"]["kind"], "NotLeaderError");

  block.validator = "A";
  block.height = 2; // needs previous_hash
  auto invalid =
      call({ { "type", "proposeBlock" }, { "block", codec::toJson(block) } });
  EXPECT_EQ(invalid["status"], 400);
  EXPECT_EQ(invalid["error"]["field"], "previousHash");

  auto stale = call({ { "type", "proposeBlock" },
                      { "block", codec::toJson(block) },
                      { "term", 0 } });
  EXPECT_EQ(stale["status"], 409);
  EXPECT_EQ(stale["error"]["kind"], "StaleTermError");
}

TEST_F(RpcServiceTest, VoteErrorsMapToStatusCodes) {
  ASSERT_TRUE(proposeFromA()["ok"].get<bool>());
  auto stranger = vote("block-1", "Z", true);
  EXPECT_EQ(stranger["status"], 403);
  EXPECT_EQ(stranger["error"]["kind"], "UnknownVoterError");

  auto missing = vote("nope", "A", true);
  EXPECT_EQ(missing["status"], 404);
  EXPECT_EQ(missing["error"]["kind"], "BlockNotFoundError");
}

TEST_F(RpcServiceTest, SubmitTransactionAndLookup) {
  auto submitted =
      call({ { "type", "submitTransaction" }, { "transaction", txJson("t1") } });
  ASSERT_TRUE(submitted["ok"].get<bool>()) << submitted.dump();
  EXPECT_TRUE(submitted["result"]["success"].get<bool>());
  EXPECT_EQ(submitted["result"]["transaction_id"], "t1");
  EXPECT_EQ(submitted["result"]["hash"].get<std::string>().size(), 64u);

  auto record =
      call({ { "type", "getTransaction" }, { "transaction_id", "t1" } });
  EXPECT_EQ(record["result"]["status"], "pending");

  auto invalid = call(
      { { "type", "submitTransaction" }, { "transaction", txJson("t2", -1) } });
  EXPECT_EQ(invalid["status"], 400);
  EXPECT_EQ(invalid["error"]["kind"], "InvalidTransactionError");
  EXPECT_EQ(invalid["error"]["field"], "amount");

  json noFrom = txJson("t3");
  noFrom.erase("from_address");
  auto missing =
      call({ { "type", "submitTransaction" }, { "transaction", noFrom } });
  EXPECT_EQ(missing["error"]["field"], "from_address");
}

TEST_F(RpcServiceTest, SubmitBatchReportsEachItem) {
  json bad = txJson("t2");
  bad["amount"] = "lots";
  auto result = call({ { "type", "submitBatch" },
                       { "transactions",
                         json::array({ txJson("t1"), bad, txJson("t1"),
                                       txJson("t4") }) } });
  ASSERT_TRUE(result["ok"].get<bool>()) << result.dump();
  EXPECT_EQ(result["result"]["processed_count"], 2);
  EXPECT_EQ(result["result"]["failed_count"], 2);
  EXPECT_EQ(result["result"]["transaction_ids"],
            json::array({ "t1", "t4" }));

  auto errors = result["result"]["errors"];
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0]["index"], 1);
  EXPECT_EQ(errors[0]["field"], "amount");
  EXPECT_EQ(errors[1]["index"], 2);
  EXPECT_EQ(errors[1]["field"], "id");
}

TEST_F(RpcServiceTest, BatchLimits) {
  auto empty = call({ { "type", "submitBatch" }, { "transactions", json::array() } });
  EXPECT_EQ(empty["status"], 400);
  EXPECT_EQ(empty["error"]["kind"], "EmptyBatchError");

  json txs = json::array();
  for (int i = 0; i < 6; ++i) {
    txs.push_back(txJson("t" + std::to_string(i)));
  }
  auto large = call({ { "type", "submitBatch" }, { "transactions", txs } });
  EXPECT_EQ(large["status"], 413);
  EXPECT_EQ(large["error"]["kind"], "BatchTooLargeError");
  EXPECT_EQ(node_.getPipeline().getRecordCount(), 0u);
}

TEST_F(RpcServiceTest, RegistrationDoesNotImplyEligibility) {
  json node = { { "node_id", "val-1" }, { "stake", 50000 } };
  auto registered = call({ { "type", "registerNode" }, { "node", node } });
  ASSERT_TRUE(registered["ok"].get<bool>()) << registered.dump();
  EXPECT_TRUE(registered["result"]["success"].get<bool>());
  EXPECT_EQ(registered["result"]["node_id"], "val-1");
  EXPECT_FALSE(node_.getRegistry().isEligibleForConsensus("val-1"));

  auto badType = call({ { "type", "registerNode" },
                        { "node", { { "node_id", "x" }, { "type", "miner" } } } });
  EXPECT_EQ(badType["error"]["field"], "type");
}

TEST_F(RpcServiceTest, MembershipOperations) {
  auto slashed = call(
      { { "type", "slashNode" }, { "node_id", "C" }, { "reason", "equivocation" } });
  ASSERT_TRUE(slashed["ok"].get<bool>());
  EXPECT_EQ(slashed["result"]["slash_count"], 1);

  auto suspended = call({ { "type", "setNodeStatus" },
                          { "node_id", "C" },
                          { "status", "SUSPENDED" } });
  ASSERT_TRUE(suspended["ok"].get<bool>());
  EXPECT_EQ(suspended["result"]["status"], "SUSPENDED");

  auto status = call({ { "type", "getStatus" } });
  EXPECT_EQ(status["result"]["active_validators"], 2);

  auto unknownStatus = call(
      { { "type", "setNodeStatus" }, { "node_id", "C" }, { "status", "GONE" } });
  EXPECT_EQ(unknownStatus["status"], 400);

  auto beat = call({ { "type", "nodeHeartbeat" }, { "node_id", "A" } });
  EXPECT_TRUE(beat["result"]["is_active"].get<bool>());

  auto fetched = call({ { "type", "getNode" }, { "node_id", "C" } });
  EXPECT_FALSE(fetched["result"]["audit"].empty());
}

TEST_F(RpcServiceTest, StreamEventsPagesThroughHistory) {
  ASSERT_TRUE(proposeFromA()["ok"].get<bool>());
  vote("block-1", "A", true);
  vote("block-1", "B", true);
  vote("block-1", "C", true);

  auto first = call({ { "type", "streamEvents" }, { "max", 1 } });
  ASSERT_TRUE(first["ok"].get<bool>());
  ASSERT_EQ(first["result"]["events"].size(), 1u);
  EXPECT_EQ(first["result"]["events"][0]["type"], "block_proposed");

  auto rest = call({ { "type", "streamEvents" },
                     { "after_seq", first["result"]["next_seq"] } });
  bool accepted = false;
  for (const auto &event : rest["result"]["events"]) {
    accepted = accepted || event["type"] == "block_accepted";
  }
  EXPECT_TRUE(accepted);

  auto tooMany = call({ { "type", "streamEvents" }, { "max", 5000 } });
  EXPECT_EQ(tooMany["status"], 400);
}

TEST_F(RpcServiceTest, PeerMessages) {
  auto granted = call({ { "type", "requestVote" },
                        { "term", 2 },
                        { "candidate_id", "C" },
                        { "last_finalized_height", 0 },
                        { "last_log_term", 1 } });
  ASSERT_TRUE(granted["ok"].get<bool>()) << granted.dump();
  EXPECT_TRUE(granted["result"]["granted"].get<bool>());
  EXPECT_EQ(granted["result"]["term"], 2);
  EXPECT_EQ(granted["result"]["voter_id"], "B");

  auto stale = call(
      { { "type", "leaderHeartbeat" }, { "term", 1 }, { "leader_id", "A" } });
  EXPECT_EQ(stale["status"], 409);

  auto current = call(
      { { "type", "leaderHeartbeat" }, { "term", 2 }, { "leader_id", "C" } });
  ASSERT_TRUE(current["ok"].get<bool>());
  EXPECT_EQ(current["result"]["node_id"], "B");
  EXPECT_EQ(node_.getEngine().getLeader(), "C");
}

TEST(RpcServiceStatusTest, EveryErrorKindHasAStatus) {
  EXPECT_EQ(RpcService::statusFor(ErrorKind::VALIDATION), 400);
  EXPECT_EQ(RpcService::statusFor(ErrorKind::INVALID_TRANSACTION), 400);
  EXPECT_EQ(RpcService::statusFor(ErrorKind::EMPTY_BATCH), 400);
  EXPECT_EQ(RpcService::statusFor(ErrorKind::UNKNOWN_VOTER), 403);
  EXPECT_EQ(RpcService::statusFor(ErrorKind::BLOCK_NOT_FOUND), 404);
  EXPECT_EQ(RpcService::statusFor(ErrorKind::NOT_LEADER), 409);
  EXPECT_EQ(RpcService::statusFor(ErrorKind::STALE_TERM), 409);
  EXPECT_EQ(RpcService::statusFor(ErrorKind::DUPLICATE_VOTE), 409);
  EXPECT_EQ(RpcService::statusFor(ErrorKind::BATCH_TOO_LARGE), 413);
  EXPECT_EQ(RpcService::statusFor(ErrorKind::INTERNAL), 500);
  EXPECT_EQ(RpcService::statusFor(ErrorKind::BUFFER_FULL), 503);
  EXPECT_EQ(RpcService::statusFor(ErrorKind::QUORUM_TIMEOUT), 504);
}
