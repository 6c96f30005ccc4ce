#include "NodeServer.h"
#include "JsonCodec.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <filesystem>
#include <limits>
#include <stdexcept>

namespace hr {

using nlohmann::json;

namespace {

const json &sectionOf(const json &jd, const std::string &name) {
  static const json empty = json::object();
  auto it = jd.find(name);
  if (it == jd.end() || it->is_null()) {
    return empty;
  }
  return *it;
}

// Unsigned config value narrowed to the field's type
template <typename T>
consensus::Roe<void> readCount(const json &j, const std::string &key, T &out) {
  uint64_t value = out;
  auto result = codec::readUInt(j, key, value, false);
  if (!result) {
    return result;
  }
  if (value > std::numeric_limits<T>::max()) {
    consensus::Error error(consensus::ErrorKind::VALIDATION,
                           key + ": out of range");
    error.field = key;
    return error;
  }
  out = static_cast<T>(value);
  return {};
}

} // namespace

NodeServer::NodeServer() : Service("NodeServer"), node_(clock_), rpc_(node_) {
  node_.redirectLogger(log().getFullName() + ".Node");
  rpc_.redirectLogger(log().getFullName() + ".Rpc");
  fetchServer_.redirectLogger(log().getFullName() + ".FetchServer");
  broadcaster_.redirectLogger(log().getFullName() + ".Peers");
}

NodeServer::~NodeServer() { stop(); }

json NodeServer::defaultConfigJson() {
  ConsensusNode::Engine::Config engine;
  TxPipeline::Config pipeline;
  consensus::MembershipRegistry::Config registry;

  json jd;
  jd["nodeId"] = DEFAULT_NODE_ID;
  jd["host"] = DEFAULT_HOST;
  jd["port"] = DEFAULT_PORT;
  jd["peers"] = json::array();
  jd["bootstrapLeader"] = "";
  jd["logLevel"] = "info";
  jd["tickIntervalMs"] = DEFAULT_TICK_INTERVAL_MS;

  jd["consensus"] = {
    { "electionTimeoutMinMs", engine.electionTimeoutMinMs },
    { "electionTimeoutMaxMs", engine.electionTimeoutMaxMs },
    { "heartbeatIntervalMs", engine.heartbeatIntervalMs },
    { "roundTimeoutMs", engine.roundTimeoutMs },
    { "maxBufferedProposals", engine.maxBufferedProposals },
    { "verifyBlockHash", engine.verifyBlockHash },
    { "autoVote", true },
    { "blockReward", ConsensusNode::DEFAULT_BLOCK_REWARD },
  };

  jd["pipeline"] = {
    { "batchSize", pipeline.batchSize },
    { "batchTimeoutMs", pipeline.batchTimeoutMs },
    { "maxBatchSize", pipeline.maxBatchSize },
    { "maxRetries", pipeline.maxRetries },
    { "maxPending", pipeline.maxPending },
    { "maxFinishedRecords", pipeline.maxFinishedRecords },
    { "verifySignatures", pipeline.verifySignatures },
  };

  jd["registry"] = {
    { "minStake", registry.minStake },
    { "minPerformance", registry.minPerformance },
    { "maxSlashes", registry.maxSlashes },
    { "emaAlpha", registry.emaAlpha },
    { "slashReputationPenalty", registry.slashReputationPenalty },
    { "slashPerformancePenalty", registry.slashPerformancePenalty },
    { "heartbeatTimeoutMs", registry.heartbeatTimeoutMs },
  };

  json self;
  self["node_id"] = DEFAULT_NODE_ID;
  self["address"] = DEFAULT_HOST;
  self["port"] = DEFAULT_PORT;
  self["type"] = consensus::toString(consensus::NodeType::VALIDATOR);
  self["stake"] = registry.minStake;
  jd["validators"] = json::array({ self });
  return jd;
}

NodeServer::Roe<NodeServer::Config>
NodeServer::parseConfig(const json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  Config config;
  auto &engine = config.node.engine;
  auto &pipeline = config.node.pipeline;
  auto &registry = config.node.registry;
  engine.nodeId = DEFAULT_NODE_ID;

  for (const char *name : { "consensus", "pipeline", "registry" }) {
    if (!sectionOf(jd, name).is_object()) {
      return Error(E_CONFIG, std::string(name) + " must be an object");
    }
  }
  const json &cj = sectionOf(jd, "consensus");
  const json &pj = sectionOf(jd, "pipeline");
  const json &rj = sectionOf(jd, "registry");

  uint64_t port = config.endpoint.port;
  std::vector<consensus::Roe<void>> checks;
  checks.push_back(codec::readString(jd, "nodeId", engine.nodeId, false));
  checks.push_back(
      codec::readString(jd, "host", config.endpoint.address, false));
  checks.push_back(codec::readUInt(jd, "port", port, false));
  checks.push_back(codec::readString(jd, "bootstrapLeader",
                                     engine.bootstrapLeader, false));
  checks.push_back(codec::readString(jd, "logLevel", config.logLevel, false));
  checks.push_back(
      codec::readInt(jd, "tickIntervalMs", config.tickIntervalMs, false));

  checks.push_back(codec::readInt(cj, "electionTimeoutMinMs",
                                  engine.electionTimeoutMinMs, false));
  checks.push_back(codec::readInt(cj, "electionTimeoutMaxMs",
                                  engine.electionTimeoutMaxMs, false));
  checks.push_back(codec::readInt(cj, "heartbeatIntervalMs",
                                  engine.heartbeatIntervalMs, false));
  checks.push_back(
      codec::readInt(cj, "roundTimeoutMs", engine.roundTimeoutMs, false));
  checks.push_back(
      readCount(cj, "maxBufferedProposals", engine.maxBufferedProposals));
  checks.push_back(
      codec::readBool(cj, "verifyBlockHash", engine.verifyBlockHash, false));
  checks.push_back(codec::readUInt(cj, "seed", engine.seed, false));
  checks.push_back(
      codec::readBool(cj, "autoVote", config.node.autoVote, false));
  checks.push_back(
      codec::readUInt(cj, "blockReward", config.node.blockReward, false));

  checks.push_back(readCount(pj, "batchSize", pipeline.batchSize));
  checks.push_back(
      codec::readInt(pj, "batchTimeoutMs", pipeline.batchTimeoutMs, false));
  checks.push_back(readCount(pj, "maxBatchSize", pipeline.maxBatchSize));
  checks.push_back(readCount(pj, "maxRetries", pipeline.maxRetries));
  checks.push_back(readCount(pj, "maxPending", pipeline.maxPending));
  checks.push_back(
      readCount(pj, "maxFinishedRecords", pipeline.maxFinishedRecords));
  checks.push_back(codec::readBool(pj, "verifySignatures",
                                   pipeline.verifySignatures, false));

  checks.push_back(codec::readUInt(rj, "minStake", registry.minStake, false));
  checks.push_back(
      codec::readNumber(rj, "minPerformance", registry.minPerformance, false));
  checks.push_back(readCount(rj, "maxSlashes", registry.maxSlashes));
  checks.push_back(
      codec::readNumber(rj, "emaAlpha", registry.emaAlpha, false));
  checks.push_back(codec::readNumber(rj, "slashReputationPenalty",
                                     registry.slashReputationPenalty, false));
  checks.push_back(codec::readNumber(rj, "slashPerformancePenalty",
                                     registry.slashPerformancePenalty, false));
  checks.push_back(codec::readInt(rj, "heartbeatTimeoutMs",
                                  registry.heartbeatTimeoutMs, false));

  for (const auto &check : checks) {
    if (!check) {
      return Error(E_CONFIG, "Invalid configuration: " + check.error().message);
    }
  }

  if (port > std::numeric_limits<uint16_t>::max()) {
    return Error(E_CONFIG, "port must be at most 65535");
  }
  config.endpoint.port = static_cast<uint16_t>(port);
  if (engine.nodeId.empty()) {
    return Error(E_CONFIG, "nodeId must not be empty");
  }
  if (config.tickIntervalMs <= 0) {
    return Error(E_CONFIG, "tickIntervalMs must be positive");
  }

  const json &peers = sectionOf(jd, "peers");
  if (!peers.is_array() && !(peers.is_object() && peers.empty())) {
    return Error(E_CONFIG, "peers must be an array");
  }
  for (const auto &peerJson : peers) {
    PeerBroadcaster::Peer peer;
    std::string endpoint;
    auto id = codec::readString(peerJson, "id", peer.id, true);
    auto ep = codec::readString(peerJson, "endpoint", endpoint, true);
    if (!id || !ep) {
      return Error(E_CONFIG, "Invalid peer: " +
                                 (id ? ep.error().message : id.error().message));
    }
    if (!utl::parseHostPort(endpoint, peer.endpoint.address,
                            peer.endpoint.port)) {
      return Error(E_CONFIG, "Invalid endpoint for peer " + peer.id + ": " +
                                 endpoint);
    }
    config.peers.push_back(peer);
  }

  const json &validators = sectionOf(jd, "validators");
  if (!validators.is_array() &&
      !(validators.is_object() && validators.empty())) {
    return Error(E_CONFIG, "validators must be an array");
  }
  for (const auto &vj : validators) {
    auto node = codec::nodeFromJson(vj);
    if (!node) {
      return Error(E_CONFIG, "Invalid validator: " + node.error().message);
    }
    config.node.validators.push_back(*node);
  }

  return config;
}

NodeServer::Roe<void> NodeServer::writeDefaultConfig(const std::string &workDir) {
  auto configPath = std::filesystem::path(workDir) / FILE_CONFIG;
  auto written =
      utl::writeToNewFile(configPath.string(), defaultConfigJson().dump(2) + "\n");
  if (!written) {
    return Error(E_CONFIG, "Failed to write " + configPath.string() + ": " +
                               written.error().message);
  }
  return {};
}

NodeServer::Roe<void> NodeServer::init(const std::string &workDir) {
  auto configPath = std::filesystem::path(workDir) / FILE_CONFIG;
  if (!std::filesystem::exists(configPath)) {
    log().info << "No config.json found, creating with default values";
    auto written = writeDefaultConfig(workDir);
    if (!written) {
      return written.error();
    }
  }

  auto loaded = utl::loadJsonFile(configPath.string());
  if (!loaded) {
    return Error(E_CONFIG, "Failed to load configuration: " +
                               loaded.error().message);
  }
  auto parsed = parseConfig(*loaded);
  if (!parsed) {
    return parsed.error();
  }

  Config config = *parsed;
  config.node.workDir = (std::filesystem::path(workDir) / DIR_DATA).string();

  logging::getRootLogger().setLevel(logging::parseLevel(config.logLevel));
  auto logPath = (std::filesystem::path(workDir) / FILE_LOG).string();
  try {
    log().addFileHandler(logPath, logging::Level::DEBUG);
  } catch (const std::runtime_error &e) {
    return Error(E_CONFIG, e.what());
  }

  return init(config);
}

NodeServer::Roe<void> NodeServer::init(const Config &config) {
  if (isRunning()) {
    return Error(E_NODE, "NodeServer is already running");
  }
  config_ = config;
  log().info << "Initializing NodeServer";
  log().info << config_;

  node_.setDelegate(this);
  auto ready = node_.init(config_.node);
  if (!ready) {
    return Error(E_NODE, "Failed to initialize node: " + ready.error().message);
  }

  PeerBroadcaster::Config peers;
  peers.peers = config_.peers;
  peers.onReply = [this](const std::string &peerId, const std::string &type,
                         const json &response) {
    QueuedRequest qr;
    qr.kind = QueuedRequest::Kind::PEER_REPLY;
    qr.peerId = peerId;
    qr.request = type;
    qr.message = response;
    inbox_.push(std::move(qr));
  };
  broadcaster_.init(peers);

  log().info << "NodeServer initialization complete";
  return {};
}

Service::Roe<void> NodeServer::onStart() {
  network::FetchServer::Config fetchConfig;
  fetchConfig.endpoint = config_.endpoint;
  fetchConfig.handler = [this](int fd, const std::string &request,
                               const network::IpEndpoint &peer) {
    QueuedRequest qr;
    qr.kind = QueuedRequest::Kind::REQUEST;
    qr.fd = fd;
    qr.request = request;
    inbox_.push(std::move(qr));
    log().debug << "Request from " << peer << " enqueued (queue size: "
                << inbox_.size() << ")";
  };
  auto serverStarted = fetchServer_.start(fetchConfig);
  if (!serverStarted) {
    return Service::Error(E_NETWORK, "Failed to start FetchServer: " +
                                         serverStarted.error().message);
  }
  log().info << "Listening on " << fetchServer_.getEndpoint();

  auto broadcasterStarted = broadcaster_.start();
  if (!broadcasterStarted) {
    fetchServer_.stop();
    return Service::Error(E_NETWORK, "Failed to start broadcaster: " +
                                         broadcasterStarted.error().message);
  }

  ticker_ = std::make_unique<Ticker>(
      std::chrono::milliseconds(config_.tickIntervalMs),
      [this]() { enqueueTick(); });
  ticker_->redirectLogger(log().getFullName() + ".Ticker");
  auto tickerStarted = ticker_->start();
  if (!tickerStarted) {
    broadcaster_.stop();
    fetchServer_.stop();
    return Service::Error(E_NODE, "Failed to start ticker: " +
                                      tickerStarted.error().message);
  }
  return {};
}

void NodeServer::onStop() {
  if (ticker_) {
    ticker_->stop();
    ticker_.reset();
  }
  fetchServer_.stop();
  broadcaster_.stop();

  std::lock_guard<std::mutex> lock(callMutex_);
  QueuedRequest qr;
  while (inbox_.poll(qr)) {
    rejectQueuedRequest(qr);
  }
  tickQueued_ = false;
  log().info << "NodeServer resources cleaned up";
}

void NodeServer::enqueueTick() {
  // At most one tick waits in the inbox
  if (tickQueued_.exchange(true)) {
    return;
  }
  QueuedRequest qr;
  qr.kind = QueuedRequest::Kind::TICK;
  inbox_.push(std::move(qr));
}

std::future<json> NodeServer::call(const json &request) {
  auto promise = std::make_shared<std::promise<json>>();
  auto future = promise->get_future();
  std::lock_guard<std::mutex> lock(callMutex_);
  if (!isRunning() || isStopSet()) {
    promise->set_value(RpcService::errorResponse(consensus::Error(
        consensus::ErrorKind::INTERNAL, "Node server is not running")));
    return future;
  }
  QueuedRequest qr;
  qr.kind = QueuedRequest::Kind::CALL;
  qr.message = request;
  qr.promise = promise;
  inbox_.push(std::move(qr));
  return future;
}

void NodeServer::runLoop() {
  log().info << "Request handler thread started";
  while (!isStopSet()) {
    QueuedRequest qr;
    if (inbox_.waitPoll(qr, std::chrono::milliseconds(50))) {
      processQueuedRequest(qr);
    }
  }
  log().info << "Request handler thread stopped";
}

void NodeServer::processQueuedRequest(QueuedRequest &qr) {
  switch (qr.kind) {
  case QueuedRequest::Kind::TICK:
    tickQueued_ = false;
    node_.tick();
    break;
  case QueuedRequest::Kind::REQUEST: {
    std::string response = rpc_.handleRequest(qr.request);
    auto sent = fetchServer_.addResponse(qr.fd, response);
    if (!sent) {
      log().error << "Failed to send response: " << sent.error().message;
    }
    break;
  }
  case QueuedRequest::Kind::CALL:
    qr.promise->set_value(rpc_.handle(qr.message));
    break;
  case QueuedRequest::Kind::PEER_REPLY:
    handlePeerReply(qr.peerId, qr.request, qr.message);
    break;
  }
}

void NodeServer::rejectQueuedRequest(QueuedRequest &qr) {
  json response = RpcService::errorResponse(consensus::Error(
      consensus::ErrorKind::INTERNAL, "Node server is shutting down"));
  if (qr.kind == QueuedRequest::Kind::REQUEST) {
    auto sent = fetchServer_.addResponse(qr.fd, response.dump());
    if (!sent) {
      log().debug << "Dropped response on shutdown: " << sent.error().message;
    }
  } else if (qr.kind == QueuedRequest::Kind::CALL) {
    qr.promise->set_value(response);
  }
}

void NodeServer::handlePeerReply(const std::string &peerId,
                                 const std::string &type,
                                 const json &response) {
  auto ok = response.is_object() ? response.find("ok") : response.end();
  if (ok == response.end() || !ok->is_boolean() || !ok->get<bool>()) {
    log().debug << "Peer " << peerId << " refused " << type << ": "
                << response.dump();
    // A refusal still proves the peer is alive
    node_.handlePeerAck(0, peerId);
    return;
  }

  const json &result = sectionOf(response, "result");
  if (type == "requestVote") {
    ConsensusNode::Engine::VoteResponse vote;
    vote.voterId = peerId;
    auto term = codec::readUInt(result, "term", vote.term, true);
    auto granted = codec::readBool(result, "granted", vote.granted, true);
    auto voter = codec::readString(result, "voter_id", vote.voterId, false);
    if (!term || !granted || !voter) {
      log().warning << "Malformed vote response from " << peerId;
      return;
    }
    node_.handleVoteResponse(vote);
  } else {
    uint64_t term = 0;
    auto read = codec::readUInt(result, "term", term, false);
    if (!read) {
      log().warning << "Malformed " << type << " reply from " << peerId;
      term = 0;
    }
    node_.handlePeerAck(term, peerId);
  }
}

// ----- transport -----

void NodeServer::broadcastProposal(const consensus::Block &block) {
  json message;
  message["type"] = "proposeBlock";
  message["block"] = codec::toJson(block);
  message["term"] = node_.getEngine().getTerm();
  broadcaster_.broadcast(message);
}

void NodeServer::broadcastVote(const consensus::Vote &vote, uint64_t term) {
  json message;
  message["type"] = "voteOnBlock";
  message["block_hash"] = vote.blockHash;
  message["voter_id"] = vote.voterId;
  message["approve"] = vote.approve;
  message["term"] = term;
  broadcaster_.broadcast(message);
}

void NodeServer::requestVotes(
    const ConsensusNode::Engine::VoteRequest &request) {
  json message;
  message["type"] = "requestVote";
  message["term"] = request.term;
  message["candidate_id"] = request.candidateId;
  message["last_finalized_height"] = request.lastFinalizedHeight;
  message["last_log_term"] = request.lastLogTerm;
  broadcaster_.broadcast(message);
}

void NodeServer::sendHeartbeat(uint64_t term, const std::string &leaderId,
                               uint64_t finalizedHeight) {
  json message;
  message["type"] = "leaderHeartbeat";
  message["term"] = term;
  message["leader_id"] = leaderId;
  message["last_finalized_height"] = finalizedHeight;
  broadcaster_.broadcast(message);
}

std::ostream &operator<<(std::ostream &os, const NodeServer::Config &config) {
  os << "NodeServer::Config{endpoint=" << config.endpoint
     << " peers=" << config.peers.size() << " logLevel=" << config.logLevel
     << " tickIntervalMs=" << config.tickIntervalMs << " node=" << config.node
     << "}";
  return os;
}

} // namespace hr
