#include "TcpConnection.h"
#include "TcpServer.h"
#include <gtest/gtest.h>

#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace hr::network;

class TcpConnectionTest : public ::testing::Test {
protected:
  void SetUp() override {
    int sockets[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sockets), 0);
    serverSocket_ = sockets[0];
    clientSocket_ = sockets[1];
  }

  void TearDown() override {
    if (clientSocket_ >= 0) {
      ::close(clientSocket_);
    }
  }

  int serverSocket_ = -1;
  int clientSocket_ = -1;
};

TEST_F(TcpConnectionTest, SendAndReceiveAll) {
  TcpConnection server(serverSocket_);
  TcpConnection client(clientSocket_);
  clientSocket_ = -1;

  auto sent = client.sendAndShutdown("hello world");
  ASSERT_TRUE(sent.isOk()) << sent.error().message;
  EXPECT_EQ(*sent, 11u);

  auto received = server.receiveAll(1024);
  ASSERT_TRUE(received.isOk()) << received.error().message;
  EXPECT_EQ(*received, "hello world");
}

TEST_F(TcpConnectionTest, ReceiveAllEnforcesLimit) {
  TcpConnection server(serverSocket_);
  TcpConnection client(clientSocket_);
  clientSocket_ = -1;

  ASSERT_TRUE(client.sendAndShutdown(std::string(100, 'x')).isOk());
  auto received = server.receiveAll(10);
  EXPECT_TRUE(received.isError());
}

TEST_F(TcpConnectionTest, MoveTransfersOwnership) {
  TcpConnection first(serverSocket_);
  TcpConnection second(std::move(first));
  EXPECT_FALSE(first.isOpen());
  EXPECT_TRUE(second.isOpen());
  EXPECT_TRUE(first.send("x").isError());

  second.close();
  EXPECT_FALSE(second.isOpen());
}

TEST(TcpServerTest, ListensOnEphemeralPortAndAccepts) {
  TcpServer server;
  auto listening = server.listen({"127.0.0.1", 0});
  ASSERT_TRUE(listening.isOk()) << listening.error().message;
  EXPECT_TRUE(server.isListening());
  ASSERT_NE(server.getEndpoint().port, 0);

  auto none = server.accept();
  EXPECT_TRUE(none.isError());

  auto client = TcpConnection::connect(server.getEndpoint(),
                                       std::chrono::milliseconds(1000));
  ASSERT_TRUE(client.isOk()) << client.error().message;

  auto ready = server.waitForEvents(1000);
  ASSERT_TRUE(ready.isOk());
  EXPECT_TRUE(*ready);
  auto accepted = server.accept();
  ASSERT_TRUE(accepted.isOk()) << accepted.error().message;
  TcpConnection serverSide(*accepted);
  EXPECT_EQ(serverSide.getPeerEndpoint().address, "127.0.0.1");

  server.stop();
  EXPECT_FALSE(server.isListening());
}

TEST(TcpServerTest, SecondBindOnSamePortFails) {
  TcpServer first;
  ASSERT_TRUE(first.listen({"127.0.0.1", 0}).isOk());
  TcpServer second;
  auto result = second.listen(first.getEndpoint());
  EXPECT_TRUE(result.isError());
}

TEST(TcpServerTest, ConnectToClosedPortFails) {
  uint16_t port = 0;
  {
    TcpServer server;
    ASSERT_TRUE(server.listen({"127.0.0.1", 0}).isOk());
    port = server.getEndpoint().port;
  }
  auto client =
      TcpConnection::connect({"127.0.0.1", port}, std::chrono::milliseconds(500));
  EXPECT_TRUE(client.isError());
}
