#ifndef HR_NODE_SERVER_H
#define HR_NODE_SERVER_H

#include "ConsensusNode.h"
#include "PeerBroadcaster.h"
#include "RpcService.h"
#include "../lib/Clock.h"
#include "../lib/ResultOrError.hpp"
#include "../lib/Service.h"
#include "../lib/ThreadSafeQueue.hpp"
#include "../lib/Ticker.h"
#include "../network/FetchServer.h"
#include "../network/Types.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace hr {

/**
 * NodeServer - runs one ConsensusNode behind a FetchServer.
 *
 * Every client request, in-process call, timer tick and peer reply is queued
 * on the inbox and handled by the service thread, which is the only thread
 * touching the node. Outbound consensus messages leave through the
 * PeerBroadcaster.
 */
class NodeServer : public Service, public ConsensusNode::Transport {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Error codes
  static constexpr const int32_t E_CONFIG = -1;
  static constexpr const int32_t E_NETWORK = -2;
  static constexpr const int32_t E_NODE = -3;

  constexpr static const char *DEFAULT_HOST = "localhost";
  constexpr static const uint16_t DEFAULT_PORT = 8720;
  constexpr static const char *DEFAULT_NODE_ID = "node-A";
  constexpr static const int64_t DEFAULT_TICK_INTERVAL_MS = 10;

  constexpr static const char *FILE_CONFIG = "config.json";
  constexpr static const char *FILE_LOG = "node.log";
  constexpr static const char *DIR_DATA = "data";

  struct Config {
    network::IpEndpoint endpoint{ DEFAULT_HOST, DEFAULT_PORT };
    std::vector<PeerBroadcaster::Peer> peers;
    std::string logLevel{ "info" };
    int64_t tickIntervalMs{ DEFAULT_TICK_INTERVAL_MS };
    ConsensusNode::Config node;
  };

  /**
   * Configuration written by --init: a single validator electing itself
   */
  static nlohmann::json defaultConfigJson();

  /**
   * Build a Config from config.json contents. Absent keys keep their
   * defaults; the log directory is set by the caller.
   */
  static Roe<Config> parseConfig(const nlohmann::json &jd);

  /**
   * Create <workDir>/config.json with defaultConfigJson()
   */
  static Roe<void> writeDefaultConfig(const std::string &workDir);

  NodeServer();
  ~NodeServer() override;

  // ----- accessors -----
  const Config &getConfig() const { return config_; }
  network::IpEndpoint getEndpoint() const { return fetchServer_.getEndpoint(); }
  size_t getInboxSize() const { return inbox_.size(); }

  /**
   * Safe from any thread
   */
  EventHub &getEventHub() { return node_.getEventHub(); }

  // ----- methods -----
  /**
   * Load <workDir>/config.json, writing the default one first when it is
   * missing, and log to <workDir>/node.log
   */
  Roe<void> init(const std::string &workDir);
  Roe<void> init(const Config &config);

  /**
   * Handle a request on the service thread. Resolves with an Internal
   * error response when the server is not running.
   */
  std::future<nlohmann::json> call(const nlohmann::json &request);

  // ----- ConsensusNode::Transport -----
  void broadcastProposal(const consensus::Block &block) override;
  void broadcastVote(const consensus::Vote &vote, uint64_t term) override;
  void requestVotes(const ConsensusNode::Engine::VoteRequest &request) override;
  void sendHeartbeat(uint64_t term, const std::string &leaderId,
                     uint64_t finalizedHeight) override;

protected:
  void runLoop() override;
  Service::Roe<void> onStart() override;
  void onStop() override;

private:
  struct QueuedRequest {
    enum class Kind { REQUEST, CALL, TICK, PEER_REPLY };

    Kind kind{ Kind::REQUEST };
    int fd{ -1 };
    std::string request;
    nlohmann::json message;
    std::string peerId;
    std::shared_ptr<std::promise<nlohmann::json>> promise;
  };

  void processQueuedRequest(QueuedRequest &qr);
  void handlePeerReply(const std::string &peerId, const std::string &type,
                       const nlohmann::json &response);
  void rejectQueuedRequest(QueuedRequest &qr);
  void enqueueTick();

  SystemClock clock_;
  Config config_;
  ConsensusNode node_;
  RpcService rpc_;
  network::FetchServer fetchServer_;
  PeerBroadcaster broadcaster_;
  std::unique_ptr<Ticker> ticker_;
  ThreadSafeQueue<QueuedRequest> inbox_;
  std::mutex callMutex_; // orders call() pushes against the final drain
  std::atomic<bool> tickQueued_{ false };
};

std::ostream &operator<<(std::ostream &os, const NodeServer::Config &config);

} // namespace hr

#endif // HR_NODE_SERVER_H
