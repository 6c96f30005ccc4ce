#include "PeerBroadcaster.h"
#include "../lib/Utilities.h"

namespace hr {

PeerBroadcaster::PeerBroadcaster() : Service("server.peers") {
  client_.redirectLogger(log().getFullName() + ".FetchClient");
}

PeerBroadcaster::~PeerBroadcaster() { stop(); }

void PeerBroadcaster::init(const Config &config) {
  config_ = config;
  for (const auto &peer : config_.peers) {
    log().info << "Peer " << peer.id << " at " << peer.endpoint;
  }
}

void PeerBroadcaster::broadcast(const nlohmann::json &message) {
  for (size_t i = 0; i < config_.peers.size(); ++i) {
    enqueue(i, message);
  }
}

bool PeerBroadcaster::sendTo(const std::string &peerId,
                             const nlohmann::json &message) {
  for (size_t i = 0; i < config_.peers.size(); ++i) {
    if (config_.peers[i].id == peerId) {
      return enqueue(i, message);
    }
  }
  log().warning << "Unknown peer: " << peerId;
  return false;
}

bool PeerBroadcaster::enqueue(size_t peerIndex, const nlohmann::json &message) {
  if (outbox_.size() >= config_.maxQueued) {
    ++dropped_;
    return false;
  }
  Outbound outbound;
  outbound.peerIndex = peerIndex;
  outbound.payload = message.dump();
  outbound.type = message.value("type", "");
  outbox_.push(std::move(outbound));
  return true;
}

void PeerBroadcaster::runLoop() {
  log().info << "Broadcaster started for " << config_.peers.size() << " peers";
  while (!isStopSet()) {
    Outbound outbound;
    if (outbox_.waitPoll(outbound, std::chrono::milliseconds(50))) {
      deliver(outbound);
    }
  }
  log().info << "Broadcaster stopped (" << sent_ << " sent, " << dropped_
             << " dropped)";
}

void PeerBroadcaster::deliver(const Outbound &outbound) {
  const Peer &peer = config_.peers[outbound.peerIndex];
  auto now = std::chrono::steady_clock::now();
  auto backoff = backoffUntil_.find(outbound.peerIndex);
  if (backoff != backoffUntil_.end()) {
    if (now < backoff->second) {
      ++dropped_;
      return;
    }
    backoffUntil_.erase(backoff);
  }

  auto response = client_.fetchSync(peer.endpoint, outbound.payload,
                                    config_.timeout);
  if (!response) {
    log().debug << "Peer " << peer.id << " unreachable: "
                << response.error().message;
    backoffUntil_[outbound.peerIndex] = now + config_.retryBackoff;
    ++dropped_;
    return;
  }
  ++sent_;

  auto reply = utl::parseJson(*response);
  if (!reply) {
    log().warning << "Bad reply from " << peer.id << " to " << outbound.type
                  << ": " << reply.error().message;
    return;
  }
  if (config_.onReply) {
    config_.onReply(peer.id, outbound.type, *reply);
  }
}

} // namespace hr
