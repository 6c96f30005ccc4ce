#include "../NodeServer.h"
#include "../../network/FetchClient.h"
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <future>
#include <thread>
#include <vector>

using namespace hr;
using nlohmann::json;

namespace {

json submitRequest(const std::string &id) {
  return { { "type", "submitTransaction" },
           { "transaction",
             { { "id", id },
               { "from_address", "alice" },
               { "to_address", "bob" },
               { "amount", 7 },
               { "timestamp", 1000 } } } };
}

} // namespace

TEST(NodeServerConfigTest, EmptyConfigUsesDefaults) {
  auto config = NodeServer::parseConfig(json::object());
  ASSERT_TRUE(config.isOk()) << config.error().message;
  EXPECT_EQ(config->node.engine.nodeId, NodeServer::DEFAULT_NODE_ID);
  EXPECT_EQ(config->endpoint.port, NodeServer::DEFAULT_PORT);
  EXPECT_EQ(config->tickIntervalMs, NodeServer::DEFAULT_TICK_INTERVAL_MS);
  EXPECT_TRUE(config->peers.empty());
  EXPECT_TRUE(config->node.validators.empty());
  EXPECT_TRUE(config->node.autoVote);
}

TEST(NodeServerConfigTest, DefaultConfigParses) {
  auto config = NodeServer::parseConfig(NodeServer::defaultConfigJson());
  ASSERT_TRUE(config.isOk()) << config.error().message;
  ASSERT_EQ(config->node.validators.size(), 1u);
  EXPECT_EQ(config->node.validators[0].nodeId, NodeServer::DEFAULT_NODE_ID);
  EXPECT_EQ(config->node.validators[0].type, consensus::NodeType::VALIDATOR);
  EXPECT_EQ(config->node.pipeline.batchSize, TxPipeline::DEFAULT_BATCH_SIZE);
  EXPECT_EQ(config->node.blockReward, ConsensusNode::DEFAULT_BLOCK_REWARD);
}

TEST(NodeServerConfigTest, ReadsSectionsAndPeers) {
  json jd = { { "nodeId", "B" },
              { "port", 9001 },
              { "bootstrapLeader", "A" },
              { "tickIntervalMs", 25 },
              { "consensus", { { "roundTimeoutMs", 800 }, { "autoVote", false } } },
              { "pipeline", { { "batchSize", 7 }, { "maxRetries", 1 } } },
              { "registry", { { "minStake", 5 }, { "emaAlpha", 0.5 } } },
              { "peers",
                json::array({ { { "id", "A" }, { "endpoint", "10.0.0.1:9000" } } }) } };

  auto config = NodeServer::parseConfig(jd);
  ASSERT_TRUE(config.isOk()) << config.error().message;
  EXPECT_EQ(config->node.engine.nodeId, "B");
  EXPECT_EQ(config->node.engine.bootstrapLeader, "A");
  EXPECT_EQ(config->node.engine.roundTimeoutMs, 800);
  EXPECT_FALSE(config->node.autoVote);
  EXPECT_EQ(config->node.pipeline.batchSize, 7u);
  EXPECT_EQ(config->node.pipeline.maxRetries, 1u);
  EXPECT_EQ(config->node.registry.minStake, 5u);
  EXPECT_DOUBLE_EQ(config->node.registry.emaAlpha, 0.5);
  EXPECT_EQ(config->endpoint.port, 9001);
  EXPECT_EQ(config->tickIntervalMs, 25);
  ASSERT_EQ(config->peers.size(), 1u);
  EXPECT_EQ(config->peers[0].id, "A");
  EXPECT_EQ(config->peers[0].endpoint.address, "10.0.0.1");
  EXPECT_EQ(config->peers[0].endpoint.port, 9000);
}

TEST(NodeServerConfigTest, RejectsBadValues) {
  const json bad[] = {
    json::array(),
    { { "port", 70000 } },
    { { "port", "8720" } },
    { { "tickIntervalMs", 0 } },
    { { "nodeId", "" } },
    { { "consensus", 5 } },
    { { "pipeline", { { "batchSize", -1 } } } },
    { { "peers", json::array({ { { "id", "A" }, { "endpoint", "nohost" } } }) } },
    { { "peers", "A" } },
    { { "validators", json::array({ { { "stake", 1 } } }) } },
  };
  for (const auto &jd : bad) {
    auto config = NodeServer::parseConfig(jd);
    ASSERT_TRUE(config.isError()) << jd.dump();
    EXPECT_EQ(config.error().code, NodeServer::E_CONFIG);
  }
}

class NodeServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "hr_node_server_test";
    std::filesystem::remove_all(dir_);
  }

  void TearDown() override {
    server_.stop();
    std::filesystem::remove_all(dir_);
  }

  NodeServer::Config singleValidator() {
    NodeServer::Config config;
    config.endpoint = { "127.0.0.1", 0 };
    config.tickIntervalMs = 5;
    config.node.workDir = (dir_ / "data").string();
    config.node.engine.nodeId = "A";
    config.node.engine.bootstrapLeader = "A";
    config.node.engine.seed = 11;
    config.node.pipeline.batchSize = 1;

    consensus::Node self;
    self.nodeId = "A";
    self.type = consensus::NodeType::VALIDATOR;
    self.stake = 200000;
    config.node.validators.push_back(self);
    return config;
  }

  json callSync(const json &request) {
    auto future = server_.call(request);
    EXPECT_EQ(future.wait_for(std::chrono::seconds(5)),
              std::future_status::ready);
    return future.get();
  }

  std::filesystem::path dir_;
  NodeServer server_;
};

TEST_F(NodeServerTest, InitFromWorkDirWritesDefaultConfig) {
  auto ready = server_.init(dir_.string());
  ASSERT_TRUE(ready.isOk()) << ready.error().message;
  EXPECT_TRUE(std::filesystem::exists(dir_ / NodeServer::FILE_CONFIG));
  EXPECT_TRUE(std::filesystem::exists(dir_ / NodeServer::FILE_LOG));
  EXPECT_EQ(server_.getConfig().node.engine.nodeId, NodeServer::DEFAULT_NODE_ID);
  EXPECT_EQ(server_.getConfig().node.workDir,
            (dir_ / NodeServer::DIR_DATA).string());

  auto again = NodeServer::writeDefaultConfig(dir_.string());
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, NodeServer::E_CONFIG);
}

TEST_F(NodeServerTest, CallBeforeStartFails) {
  auto response = server_.call({ { "type", "getStatus" } }).get();
  EXPECT_FALSE(response["ok"].get<bool>());
  EXPECT_EQ(response["status"], 500);
  EXPECT_EQ(response["error"]["kind"], "InternalError");
}

TEST_F(NodeServerTest, OrdersTransactionsOverTcp) {
  ASSERT_TRUE(server_.init(singleValidator()).isOk());
  auto started = server_.start();
  ASSERT_TRUE(started.isOk()) << started.error().message;

  network::FetchClient client;
  auto raw = client.fetchSync(server_.getEndpoint(),
                              submitRequest("tx-1").dump());
  ASSERT_TRUE(raw.isOk()) << raw.error().message;
  auto submitted = json::parse(*raw);
  ASSERT_TRUE(submitted["ok"].get<bool>()) << submitted.dump();
  EXPECT_EQ(submitted["result"]["transaction_id"], "tx-1");

  std::string status;
  for (int i = 0; i < 250 && status != "confirmed"; ++i) {
    auto record = callSync({ { "type", "getTransaction" },
                             { "transaction_id", "tx-1" } });
    ASSERT_TRUE(record["ok"].get<bool>()) << record.dump();
    status = record["result"]["status"].get<std::string>();
    if (status != "confirmed") {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }
  EXPECT_EQ(status, "confirmed");

  auto nodeStatus = callSync({ { "type", "getStatus" } });
  ASSERT_TRUE(nodeStatus["ok"].get<bool>());
  EXPECT_EQ(nodeStatus["result"]["leader"], "A");
  EXPECT_GE(nodeStatus["result"]["last_finalized_height"].get<uint64_t>(), 1u);
  EXPECT_GT(server_.getEventHub().getLastSeq(), 0u);
}

TEST_F(NodeServerTest, MalformedRequestGetsErrorResponse) {
  ASSERT_TRUE(server_.init(singleValidator()).isOk());
  ASSERT_TRUE(server_.start().isOk());

  network::FetchClient client;
  auto raw = client.fetchSync(server_.getEndpoint(), "{not json");
  ASSERT_TRUE(raw.isOk()) << raw.error().message;
  auto response = json::parse(*raw);
  EXPECT_FALSE(response["ok"].get<bool>());
  EXPECT_EQ(response["status"], 400);
}

TEST_F(NodeServerTest, StopRejectsLaterCalls) {
  ASSERT_TRUE(server_.init(singleValidator()).isOk());
  ASSERT_TRUE(server_.start().isOk());
  EXPECT_TRUE(callSync({ { "type", "getStatus" } })["ok"].get<bool>());

  server_.stop();
  auto response = server_.call({ { "type", "getStatus" } }).get();
  EXPECT_FALSE(response["ok"].get<bool>());
}

TEST_F(NodeServerTest, CallsRacingStopAllResolve) {
  ASSERT_TRUE(server_.init(singleValidator()).isOk());
  ASSERT_TRUE(server_.start().isOk());

  std::atomic<bool> stopped{ false };
  std::vector<std::vector<std::future<json>>> futures(4);
  std::vector<std::thread> callers;
  for (size_t t = 0; t < futures.size(); ++t) {
    callers.emplace_back([&, t] {
      bool last = false;
      // Keep calling until a call is issued after stop() returned
      while (!last) {
        last = stopped.load();
        futures[t].push_back(server_.call({ { "type", "getStatus" } }));
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      }
    });
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  server_.stop();
  stopped = true;
  for (auto &caller : callers) {
    caller.join();
  }

  for (auto &perThread : futures) {
    ASSERT_FALSE(perThread.empty());
    json response;
    for (auto &future : perThread) {
      ASSERT_EQ(future.wait_for(std::chrono::seconds(5)),
                std::future_status::ready);
      response = future.get();
      EXPECT_TRUE(response.contains("ok"));
    }
    // The last call was issued after stop() returned
    EXPECT_FALSE(response["ok"].get<bool>());
  }
}
