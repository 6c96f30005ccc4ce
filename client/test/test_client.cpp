#include "../Client.h"
#include "../../network/FetchServer.h"
#include <gtest/gtest.h>

#include <mutex>

using namespace hr;
using nlohmann::json;

// Fake node: records every request and answers with a canned response
class ClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    network::FetchServer::Config config;
    config.endpoint = { "127.0.0.1", 0 };
    config.handler = [this](int fd, const std::string &request,
                            const network::IpEndpoint &) {
      std::string reply;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(json::parse(request));
        reply = reply_;
      }
      auto sent = server_.addResponse(fd, reply);
      EXPECT_TRUE(sent.isOk());
    };
    auto started = server_.start(config);
    ASSERT_TRUE(started.isOk()) << started.error().message;
    client_.setEndpoint(server_.getEndpoint());
  }

  void TearDown() override { server_.stop(); }

  void replyWith(const json &response) {
    std::lock_guard<std::mutex> lock(mutex_);
    reply_ = response.dump();
  }

  json lastRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.empty() ? json() : requests_.back();
  }

  network::FetchServer server_;
  Client client_;
  std::mutex mutex_;
  std::vector<json> requests_;
  std::string reply_{ R"({"ok":true,"status":200,"result":{}})" };
};

TEST_F(ClientTest, ReturnsResultObject) {
  replyWith({ { "ok", true },
              { "status", 200 },
              { "result", { { "term", 4 }, { "leader", "A" } } } });
  auto status = client_.fetchStatus();
  ASSERT_TRUE(status.isOk()) << status.error().message;
  EXPECT_EQ((*status)["term"], 4);
  EXPECT_EQ((*status)["leader"], "A");
  EXPECT_EQ(lastRequest()["type"], "getStatus");
}

TEST_F(ClientTest, ServerErrorCarriesKindAndStatus) {
  replyWith({ { "ok", false },
              { "status", 409 },
              { "error",
                { { "kind", "NotLeaderError" },
                  { "message", "leader is A" } } } });
  auto voted = client_.voteOnBlock("abc", "B", true);
  ASSERT_TRUE(voted.isError());
  EXPECT_EQ(voted.error().code, Client::E_SERVER_ERROR);
  EXPECT_EQ(voted.error().status, 409);
  EXPECT_EQ(voted.error().kind, "NotLeaderError");
  EXPECT_EQ(voted.error().message, "leader is A");

  json request = lastRequest();
  EXPECT_EQ(request["type"], "voteOnBlock");
  EXPECT_EQ(request["block_hash"], "abc");
  EXPECT_EQ(request["voter_id"], "B");
  EXPECT_TRUE(request["approve"].get<bool>());
}

TEST_F(ClientTest, RequestShapes) {
  consensus::Transaction tx;
  tx.id = "tx-1";
  tx.fromAddress = "alice";
  tx.toAddress = "bob";
  tx.amount = 3;
  tx.timestamp = 1000;

  ASSERT_TRUE(client_.submitTransaction(tx).isOk());
  EXPECT_EQ(lastRequest()["transaction"]["id"], "tx-1");
  EXPECT_EQ(lastRequest()["transaction"]["from_address"], "alice");

  ASSERT_TRUE(client_.submitBatch({ tx, tx }).isOk());
  EXPECT_EQ(lastRequest()["transactions"].size(), 2u);

  consensus::Block block;
  block.height = 1;
  block.validator = "A";
  ASSERT_TRUE(client_.proposeBlock(block, 3).isOk());
  EXPECT_EQ(lastRequest()["term"], 3);
  EXPECT_EQ(lastRequest()["block"]["validator"], "A");
  ASSERT_TRUE(client_.proposeBlock(block).isOk());
  EXPECT_FALSE(lastRequest().contains("term"));

  ASSERT_TRUE(client_.setNodeStatus("C", consensus::NodeStatus::SUSPENDED,
                                    "maintenance")
                  .isOk());
  EXPECT_EQ(lastRequest()["status"], "SUSPENDED");
  EXPECT_EQ(lastRequest()["reason"], "maintenance");

  ASSERT_TRUE(client_.fetchEvents(10, 50).isOk());
  EXPECT_EQ(lastRequest()["type"], "streamEvents");
  EXPECT_EQ(lastRequest()["after_seq"], 10);
  EXPECT_EQ(lastRequest()["max"], 50);
}

TEST_F(ClientTest, UnparsableResponse) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    reply_ = "<html>";
  }
  auto status = client_.fetchStatus();
  ASSERT_TRUE(status.isError());
  EXPECT_EQ(status.error().code, Client::E_PARSE_ERROR);
}

TEST(ClientEndpointTest, RejectsBadEndpoints) {
  Client client;
  EXPECT_TRUE(client.setEndpoint("localhost:8720").isOk());
  EXPECT_EQ(client.getEndpoint().port, 8720);
  EXPECT_TRUE(client.setEndpoint("localhost").isError());
  EXPECT_TRUE(client.setEndpoint("localhost:0").isError());

  Client unset;
  auto status = unset.fetchStatus();
  ASSERT_TRUE(status.isError());
  EXPECT_EQ(status.error().code, Client::E_NOT_CONNECTED);
}
