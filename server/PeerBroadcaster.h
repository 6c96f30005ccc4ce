#ifndef HR_PEER_BROADCASTER_H
#define HR_PEER_BROADCASTER_H

#include "../lib/Service.h"
#include "../lib/ThreadSafeQueue.hpp"
#include "../network/FetchClient.h"
#include "../network/Types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hr {

/**
 * PeerBroadcaster - delivers consensus messages to the other nodes.
 *
 * Messages are queued by the caller and sent in order on the broadcaster's
 * thread, one FetchClient request each. A peer that fails to answer is
 * skipped for retryBackoffMs; messages for it are dropped meanwhile since
 * consensus traffic is periodic and stale messages are useless.
 */
class PeerBroadcaster : public Service {
public:
  struct Peer {
    std::string id;
    network::IpEndpoint endpoint;
  };

  using ReplyHandler = std::function<void(
      const std::string &peerId, const std::string &requestType,
      const nlohmann::json &response)>;

  struct Config {
    std::vector<Peer> peers;
    ReplyHandler onReply{ nullptr };
    std::chrono::milliseconds timeout{ DEFAULT_TIMEOUT_MS };
    std::chrono::milliseconds retryBackoff{ DEFAULT_RETRY_BACKOFF_MS };
    size_t maxQueued{ DEFAULT_MAX_QUEUED };
  };

  constexpr static int64_t DEFAULT_TIMEOUT_MS = 1000;
  constexpr static int64_t DEFAULT_RETRY_BACKOFF_MS = 1000;
  constexpr static size_t DEFAULT_MAX_QUEUED = 4096;

  PeerBroadcaster();
  ~PeerBroadcaster() override;

  // ----- accessors -----
  const std::vector<Peer> &getPeers() const { return config_.peers; }
  size_t getQueuedCount() const { return outbox_.size(); }
  uint64_t getSentCount() const { return sent_; }
  uint64_t getDroppedCount() const { return dropped_; }

  // ----- methods -----
  void init(const Config &config);

  /**
   * Queue a message for every peer. message["type"] names the request.
   */
  void broadcast(const nlohmann::json &message);

  /**
   * Queue a message for one peer
   * @return false if the peer is unknown or the queue is full
   */
  bool sendTo(const std::string &peerId, const nlohmann::json &message);

protected:
  void runLoop() override;

private:
  struct Outbound {
    size_t peerIndex{ 0 };
    std::string payload;
    std::string type;
  };

  bool enqueue(size_t peerIndex, const nlohmann::json &message);
  void deliver(const Outbound &outbound);

  Config config_;
  network::FetchClient client_;
  ThreadSafeQueue<Outbound> outbox_;
  // Service thread only
  std::map<size_t, std::chrono::steady_clock::time_point> backoffUntil_;
  std::atomic<uint64_t> sent_{ 0 };
  std::atomic<uint64_t> dropped_{ 0 };
};

} // namespace hr

#endif // HR_PEER_BROADCASTER_H
