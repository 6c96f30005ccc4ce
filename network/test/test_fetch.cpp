#include "FetchClient.h"
#include "FetchServer.h"
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace hr::network;

class FetchIntegrationTest : public ::testing::Test {
protected:
  void SetUp() override { server_ = std::make_unique<FetchServer>(); }

  void TearDown() override {
    server_->stop();
    server_.reset();
  }

  void startEcho() {
    FetchServer::Config config;
    config.endpoint = {"127.0.0.1", 0};
    config.maxRequestBytes = 1024 * 1024;
    config.handler = [this](int fd, const std::string &request,
                            const IpEndpoint &) {
      ++handled_;
      auto result = server_->addResponse(fd, "Echo: " + request);
      EXPECT_TRUE(result.isOk());
    };
    auto started = server_->start(config);
    ASSERT_TRUE(started.isOk()) << started.error().message;
  }

  std::unique_ptr<FetchServer> server_;
  std::atomic<int> handled_{ 0 };
};

TEST_F(FetchIntegrationTest, RequestResponseRoundTrip) {
  startEcho();
  FetchClient client;
  auto response = client.fetchSync(server_->getEndpoint(), "Hello");
  ASSERT_TRUE(response.isOk()) << response.error().message;
  EXPECT_EQ(*response, "Echo: Hello");
  EXPECT_EQ(handled_, 1);
}

TEST_F(FetchIntegrationTest, LargeRequest) {
  startEcho();
  FetchClient client;
  std::string payload(200 * 1024, 'z');
  auto response = client.fetchSync(server_->getEndpoint(), payload);
  ASSERT_TRUE(response.isOk()) << response.error().message;
  EXPECT_EQ(response->size(), payload.size() + 6);
}

TEST_F(FetchIntegrationTest, ConcurrentClients) {
  startEcho();
  std::vector<std::thread> threads;
  std::atomic<int> ok{ 0 };
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([this, i, &ok]() {
      FetchClient client;
      std::string body = "req-" + std::to_string(i);
      auto response = client.fetchSync(server_->getEndpoint(), body);
      if (response.isOk() && *response == "Echo: " + body) {
        ++ok;
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(ok, 8);
}

TEST_F(FetchIntegrationTest, OversizedRequestDropped) {
  startEcho();
  FetchClient client;
  auto response = client.fetchSync(server_->getEndpoint(),
                                   std::string(2 * 1024 * 1024, 'x'));
  if (response.isOk()) {
    EXPECT_TRUE(response->empty());
  }
  EXPECT_EQ(handled_, 0);
}

TEST_F(FetchIntegrationTest, ResponseForUnknownFdFails) {
  startEcho();
  auto result = server_->addResponse(12345, "nobody");
  EXPECT_TRUE(result.isError());
}

TEST(FetchServerTest, StartFailsOnBusyPort) {
  FetchServer first;
  FetchServer::Config config;
  config.endpoint = {"127.0.0.1", 0};
  ASSERT_TRUE(first.start(config).isOk());

  FetchServer second;
  FetchServer::Config busy;
  busy.endpoint = first.getEndpoint();
  EXPECT_TRUE(second.start(busy).isError());
  EXPECT_FALSE(second.isRunning());
  first.stop();
}

TEST(FetchClientTest, FailsWithUnresolvableHost) {
  FetchClient client;
  auto result =
      client.fetchSync({"invalid-host-that-does-not-exist.invalid", 9999},
                       "Hello", std::chrono::milliseconds(500));
  EXPECT_TRUE(result.isError());
}
