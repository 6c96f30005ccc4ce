#include "../client/Client.h"
#include "../server/JsonCodec.h"
#include "../consensus/Types.hpp"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

std::string randomTxId() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<uint64_t> dist;
  return "tx-" + std::to_string(dist(gen));
}

int printResult(const hr::Client::Roe<json> &result) {
  if (!result) {
    std::cerr << "Error: " << result.error() << "\n";
    return 1;
  }
  std::cout << result->dump(2) << "\n";
  return 0;
}

hr::Roe<std::vector<hr::consensus::Transaction>>
loadTransactions(const std::string &path) {
  std::vector<hr::consensus::Transaction> txs;
  if (path.empty()) {
    return txs;
  }
  auto loaded = hr::utl::loadJsonFile(path);
  if (!loaded) {
    return loaded.error();
  }
  if (!loaded->is_array()) {
    return hr::Error(4, path + ": expected an array of transactions");
  }
  for (const auto &item : *loaded) {
    auto tx = hr::codec::transactionFromJson(item);
    if (!tx) {
      return hr::Error(5, path + ": " + tx.error().message);
    }
    txs.push_back(*tx);
  }
  return txs;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{ "hr-client - Command-line client for HyperRAFT nodes" };
  app.require_subcommand(1);

  // Global options
  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  std::string host = hr::Client::DEFAULT_HOST;
  app.add_option("--host", host, "Node host (or host:port)")
      ->capture_default_str();

  uint16_t port = 0;
  app.add_option("-p,--port", port, "Node port (default: 8720)")
      ->check(CLI::Range(1, 65535));

  // Local command: keygen
  auto *keygen = app.add_subcommand("keygen", "Generate a new Ed25519 key pair");

  auto *status_cmd = app.add_subcommand("status", "Get consensus status");

  auto *submit_cmd = app.add_subcommand("submit", "Submit a transaction");
  hr::consensus::Transaction tx;
  std::string key;
  submit_cmd->add_option("from", tx.fromAddress, "Sender address")->required();
  submit_cmd->add_option("to", tx.toAddress, "Recipient address")->required();
  submit_cmd->add_option("amount", tx.amount, "Amount to transfer")->required();
  submit_cmd->add_option("--id", tx.id, "Transaction ID (default: random)");
  submit_cmd->add_option("-t,--type", tx.type, "Transaction type")
      ->default_val("transfer");
  submit_cmd->add_option("-n,--nonce", tx.nonce, "Sender nonce")->default_val(0);
  submit_cmd->add_option("--gas-price", tx.gasPrice, "Gas price")->default_val(0);
  submit_cmd->add_option("--gas-limit", tx.gasLimit, "Gas limit")->default_val(0);
  submit_cmd->add_option("-k,--key", key,
                         "Private key (hex or file) to sign with; 'from' must "
                         "then be the hex public key");

  auto *batch_cmd =
      app.add_subcommand("submit-batch", "Submit transactions from a JSON file");
  std::string batchFile;
  batch_cmd->add_option("file", batchFile, "JSON array of transactions")
      ->required();

  auto *propose_cmd = app.add_subcommand("propose", "Propose a block");
  hr::consensus::Block block;
  std::string proposeTxFile;
  std::optional<uint64_t> proposeTerm;
  propose_cmd->add_option("height", block.height, "Block height")->required();
  propose_cmd->add_option("validator", block.validator, "Proposing validator")
      ->required();
  propose_cmd->add_option("--previous-hash", block.previousHash,
                          "Hash of the block at height - 1");
  propose_cmd->add_option("--txs", proposeTxFile,
                          "JSON array of transactions to include");
  propose_cmd->add_option("--term", proposeTerm, "Leader term");

  auto *vote_cmd = app.add_subcommand("vote", "Vote on a pending block");
  std::string voteHash;
  std::string voterId;
  bool reject = false;
  vote_cmd->add_option("blockHash", voteHash, "Block hash")->required();
  vote_cmd->add_option("voterId", voterId, "Voting validator")->required();
  vote_cmd->add_flag("--reject", reject, "Vote against the block");

  auto *register_cmd = app.add_subcommand("register", "Register a node");
  hr::consensus::Node node;
  std::string nodeType = "validator";
  register_cmd->add_option("nodeId", node.nodeId, "Node ID")->required();
  register_cmd->add_option("--address", node.address, "Node address");
  register_cmd->add_option("--node-port", node.port, "Node port");
  register_cmd->add_option("--type", nodeType, "Node type")
      ->capture_default_str();
  register_cmd->add_option("--stake", node.stake, "Stake")->default_val(0);

  auto *heartbeat_cmd = app.add_subcommand("heartbeat", "Report node liveness");
  std::string heartbeatId;
  heartbeat_cmd->add_option("nodeId", heartbeatId, "Node ID")->required();

  auto *slash_cmd = app.add_subcommand("slash", "Slash a node");
  std::string slashId;
  std::string slashReason;
  slash_cmd->add_option("nodeId", slashId, "Node ID")->required();
  slash_cmd->add_option("reason", slashReason, "Reason")->required();

  auto *set_status_cmd =
      app.add_subcommand("set-status", "Set node status (ACTIVE, INACTIVE, SUSPENDED)");
  std::string statusId;
  std::string statusName;
  std::string statusReason = "operator request";
  set_status_cmd->add_option("nodeId", statusId, "Node ID")->required();
  set_status_cmd->add_option("status", statusName, "New status")->required();
  set_status_cmd->add_option("--reason", statusReason, "Reason")
      ->capture_default_str();

  auto *node_cmd = app.add_subcommand("node", "Get node record");
  std::string nodeId;
  node_cmd->add_option("nodeId", nodeId, "Node ID")->required();

  auto *tx_cmd = app.add_subcommand("tx", "Get transaction status");
  std::string txId;
  tx_cmd->add_option("txId", txId, "Transaction ID")->required();

  auto *block_cmd = app.add_subcommand("block", "Get block by hash");
  std::string blockHash;
  block_cmd->add_option("blockHash", blockHash, "Block hash")->required();

  auto *events_cmd = app.add_subcommand("events", "Read consensus events");
  uint64_t afterSeq = 0;
  uint64_t maxEvents = 100;
  events_cmd->add_option("--after", afterSeq, "Return events after this sequence")
      ->default_val(0);
  events_cmd->add_option("--max", maxEvents, "Maximum number of events")
      ->default_val(100)
      ->check(CLI::Range(1, 1000));

  CLI11_PARSE(app, argc, argv);

  // Handle keygen command (no node connection needed)
  if (keygen->parsed()) {
    auto pair = hr::utl::ed25519Generate();
    if (!pair.isOk()) {
      std::cerr << "Error: " << pair.error().message << "\n";
      return 1;
    }
    std::cout << "Ed25519 key pair generated.\n";
    std::cout << "Public key (hex):   " << hr::utl::hexEncode(pair->publicKey)
              << "\n";
    std::cout << "Private key (hex):  " << hr::utl::hexEncode(pair->privateKey)
              << "\n";
    std::cout << "\nUse the public key as the sender address of signed "
                 "transactions.\n";
    return 0;
  }

  // Parse host:port format if present
  std::string parsedHost = host;
  uint16_t parsedPort = port;
  uint16_t extractedPort = 0;
  if (hr::utl::parseHostPort(host, parsedHost, extractedPort)) {
    if (port == 0) {
      parsedPort = extractedPort;
    }
  }
  if (parsedPort == 0) {
    parsedPort = hr::Client::DEFAULT_PORT;
  }

  hr::logging::getRootLogger().setLevel(debug ? hr::logging::Level::DEBUG
                                              : hr::logging::Level::WARNING);
  hr::Client client;
  client.setEndpoint(hr::network::IpEndpoint{ parsedHost, parsedPort });

  if (status_cmd->parsed()) {
    return printResult(client.fetchStatus());
  }

  if (submit_cmd->parsed()) {
    if (tx.id.empty()) {
      tx.id = randomTxId();
    }
    tx.timestamp = hr::utl::getCurrentTimeMs();
    if (!key.empty()) {
      auto privateKey = hr::utl::readPrivateKey(key);
      if (!privateKey) {
        std::cerr << "Error: " << privateKey.error().message << "\n";
        return 1;
      }
      auto signature = hr::utl::ed25519Sign(*privateKey, tx.canonical());
      if (!signature) {
        std::cerr << "Error: " << signature.error().message << "\n";
        return 1;
      }
      tx.signature = hr::utl::hexEncode(*signature);
    }
    return printResult(client.submitTransaction(tx));
  }

  if (batch_cmd->parsed()) {
    auto txs = loadTransactions(batchFile);
    if (!txs) {
      std::cerr << "Error: " << txs.error().message << "\n";
      return 1;
    }
    return printResult(client.submitBatch(*txs));
  }

  if (propose_cmd->parsed()) {
    auto txs = loadTransactions(proposeTxFile);
    if (!txs) {
      std::cerr << "Error: " << txs.error().message << "\n";
      return 1;
    }
    block.transactions = *txs;
    block.timestamp = hr::utl::getCurrentTimeMs();
    block.hash = block.computeHash();
    return printResult(client.proposeBlock(block, proposeTerm));
  }

  if (vote_cmd->parsed()) {
    return printResult(client.voteOnBlock(voteHash, voterId, !reject));
  }

  if (register_cmd->parsed()) {
    if (!hr::consensus::parseNodeType(nodeType, node.type)) {
      std::cerr << "Error: unknown node type '" << nodeType << "'\n";
      return 1;
    }
    return printResult(client.registerNode(node));
  }

  if (heartbeat_cmd->parsed()) {
    return printResult(client.heartbeat(heartbeatId));
  }

  if (slash_cmd->parsed()) {
    return printResult(client.slashNode(slashId, slashReason));
  }

  if (set_status_cmd->parsed()) {
    hr::consensus::NodeStatus newStatus = hr::consensus::NodeStatus::ACTIVE;
    if (!hr::consensus::parseNodeStatus(statusName, newStatus)) {
      std::cerr << "Error: unknown status '" << statusName << "'\n";
      return 1;
    }
    return printResult(client.setNodeStatus(statusId, newStatus, statusReason));
  }

  if (node_cmd->parsed()) {
    return printResult(client.fetchNode(nodeId));
  }

  if (tx_cmd->parsed()) {
    return printResult(client.fetchTransaction(txId));
  }

  if (block_cmd->parsed()) {
    return printResult(client.fetchBlock(blockHash));
  }

  if (events_cmd->parsed()) {
    return printResult(client.fetchEvents(afterSeq, maxEvents));
  }

  return 0;
}
