#include "TxPipeline.h"
#include "../consensus/Validation.h"
#include "../lib/Utilities.h"

namespace hr {

using consensus::Block;
using consensus::Transaction;
using consensus::TxStatus;

TxPipeline::TxPipeline() : Module("server.tx_pipeline") {}

void TxPipeline::init(const Config &config) {
  config_ = config;
  log().info << "Initialized with " << config_;
}

TxPipeline::Roe<TxPipeline::Record>
TxPipeline::getRecord(const std::string &txId) const {
  auto it = records_.find(txId);
  if (it == records_.end()) {
    return Error(ErrorKind::VALIDATION, "Unknown transaction: " + txId);
  }
  return it->second;
}

bool TxPipeline::isKnown(const std::string &txId) const {
  return records_.count(txId) > 0 || retiredIds_.count(txId) > 0;
}

bool TxPipeline::isBatchReady(int64_t nowMs) const {
  if (pendingCount_ == 0) {
    return false;
  }
  if (pendingCount_ >= config_.batchSize) {
    return true;
  }
  for (const auto &id : queue_) {
    auto it = records_.find(id);
    if (it != records_.end() && it->second.status == TxStatus::PENDING) {
      return nowMs - it->second.submittedAtMs >= config_.batchTimeoutMs;
    }
  }
  return false;
}

TxPipeline::Roe<void> TxPipeline::validate(const Transaction &tx) const {
  auto fields = consensus::checkTransactionFields(tx);
  if (!fields) {
    return fields;
  }
  if (isKnown(tx.id)) {
    return Error::invalidTransaction("id", "duplicate transaction id '" +
                                               tx.id + "'");
  }
  // Nonce 0 is unsequenced only for senders that never used a nonce
  auto nonceIt = lastNonce_.find(tx.fromAddress);
  if (nonceIt != lastNonce_.end() && tx.nonce <= nonceIt->second) {
    return Error::invalidTransaction(
        "nonce", "must be greater than " + std::to_string(nonceIt->second) +
                     " for sender " + tx.fromAddress);
  }
  if (config_.verifySignatures) {
    std::string publicKey = utl::hexDecode(tx.fromAddress);
    std::string signature = utl::hexDecode(tx.signature);
    if (publicKey.size() != 32) {
      return Error::invalidTransaction(
          "fromAddress", "must be a hex Ed25519 public key");
    }
    if (signature.size() != 64 ||
        !utl::ed25519Verify(publicKey, tx.canonical(), signature)) {
      return Error::invalidTransaction("signature", "verification failed");
    }
  }
  return {};
}

TxPipeline::Roe<TxPipeline::Receipt> TxPipeline::submit(const Transaction &tx,
                                                        int64_t nowMs) {
  auto valid = validate(tx);
  if (!valid) {
    log().debug << "Rejected transaction '" << tx.id
                << "': " << valid.error().message;
    return valid.error();
  }
  if (pendingCount_ >= config_.maxPending) {
    return Error(ErrorKind::BUFFER_FULL,
                 "Pending queue is full (" +
                     std::to_string(config_.maxPending) + " transactions)");
  }

  Record record;
  record.tx = tx;
  record.hash = tx.computeHash();
  record.status = TxStatus::PENDING;
  record.submittedAtMs = nowMs;
  Receipt receipt{ tx.id, record.hash };

  if (tx.nonce > 0) {
    lastNonce_[tx.fromAddress] = tx.nonce;
  }
  records_.emplace(tx.id, std::move(record));
  queue_.push_back(tx.id);
  ++pendingCount_;
  log().debug << "Accepted transaction " << tx.id << " (" << pendingCount_
              << " pending)";
  return receipt;
}

TxPipeline::Roe<TxPipeline::BatchResult>
TxPipeline::submitBatch(const std::vector<Transaction> &txs, int64_t nowMs) {
  if (txs.empty()) {
    return Error(ErrorKind::EMPTY_BATCH, "Batch contains no transactions");
  }
  if (txs.size() > config_.maxBatchSize) {
    return Error(ErrorKind::BATCH_TOO_LARGE,
                 "Batch of " + std::to_string(txs.size()) +
                     " exceeds the maximum of " +
                     std::to_string(config_.maxBatchSize));
  }

  BatchResult result;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto receipt = submit(txs[i], nowMs);
    if (receipt) {
      ++result.accepted;
      result.receipts.push_back(*receipt);
    } else {
      ++result.rejected;
      result.errors.push_back({ i, txs[i].id, receipt.error() });
    }
  }
  log().info << "Batch of " << txs.size() << ": " << result.accepted
             << " accepted, " << result.rejected << " rejected";
  return result;
}

std::vector<Transaction> TxPipeline::takeBatch(int64_t nowMs) {
  std::vector<Transaction> batch;
  if (!isBatchReady(nowMs)) {
    return batch;
  }

  while (!queue_.empty() && batch.size() < config_.batchSize) {
    std::string id = queue_.front();
    queue_.pop_front();
    auto it = records_.find(id);
    if (it == records_.end() || it->second.status != TxStatus::PENDING) {
      continue;
    }
    it->second.status = TxStatus::INCLUDED;
    --pendingCount_;
    batch.push_back(it->second.tx);
  }
  log().debug << "Took batch of " << batch.size() << " (" << pendingCount_
              << " still pending)";
  return batch;
}

void TxPipeline::markIncluded(const std::vector<std::string> &txIds,
                              const std::string &blockHash,
                              uint64_t blockHeight) {
  for (const auto &id : txIds) {
    auto it = records_.find(id);
    if (it == records_.end()) {
      continue;
    }
    it->second.blockHash = blockHash;
    it->second.blockHeight = blockHeight;
  }
}

size_t TxPipeline::confirm(const Block &block) {
  size_t confirmed = 0;
  for (const auto &tx : block.transactions) {
    if (retiredIds_.count(tx.id) > 0) {
      continue;
    }
    auto it = records_.find(tx.id);
    if (it == records_.end()) {
      // Ordered through another node
      Record record;
      record.tx = tx;
      record.hash = tx.computeHash();
      record.submittedAtMs = block.timestamp;
      it = records_.emplace(tx.id, std::move(record)).first;
    } else if (it->second.status == TxStatus::CONFIRMED) {
      continue;
    } else if (it->second.status == TxStatus::PENDING) {
      --pendingCount_;
    }
    Record &record = it->second;
    record.status = TxStatus::CONFIRMED;
    record.blockHash = block.hash;
    record.blockHeight = block.height;
    if (tx.nonce > 0 && tx.nonce > lastNonce_[tx.fromAddress]) {
      lastNonce_[tx.fromAddress] = tx.nonce;
    }
    finish(tx.id);
    ++confirmed;
  }
  return confirmed;
}

size_t TxPipeline::onFinalized(const Block &block) {
  size_t confirmed = confirm(block);
  log().info << "Confirmed " << confirmed << " transactions in block "
             << block.height;
  return confirmed;
}

void TxPipeline::restoreConfirmed(const Block &block) { confirm(block); }

void TxPipeline::onAborted(const std::vector<std::string> &txIds,
                           const std::string &reason) {
  size_t requeued = 0;
  size_t failed = 0;
  for (auto rit = txIds.rbegin(); rit != txIds.rend(); ++rit) {
    auto it = records_.find(*rit);
    if (it == records_.end() || it->second.status != TxStatus::INCLUDED) {
      continue;
    }
    Record &record = it->second;
    record.attempts += 1;
    record.lastError = reason;
    record.blockHash.clear();
    record.blockHeight = 0;
    if (record.attempts > config_.maxRetries) {
      record.status = TxStatus::FAILED;
      finish(*rit);
      ++failed;
      continue;
    }
    record.status = TxStatus::PENDING;
    queue_.push_front(*rit);
    ++pendingCount_;
    ++requeued;
  }
  if (requeued > 0 || failed > 0) {
    log().warning << "Block aborted (" << reason << "): " << requeued
                  << " transactions requeued, " << failed << " failed";
  }
}

void TxPipeline::finish(const std::string &txId) {
  finished_.push_back(txId);
  while (finished_.size() > config_.maxFinishedRecords) {
    auto it = records_.find(finished_.front());
    if (it != records_.end() && (it->second.status == TxStatus::CONFIRMED ||
                                 it->second.status == TxStatus::FAILED)) {
      retiredIds_.insert(it->first);
      records_.erase(it);
    }
    finished_.pop_front();
  }
}

std::ostream &operator<<(std::ostream &os, const TxPipeline::Config &config) {
  os << "batchSize=" << config.batchSize
     << " batchTimeoutMs=" << config.batchTimeoutMs
     << " maxBatchSize=" << config.maxBatchSize
     << " maxRetries=" << config.maxRetries
     << " maxPending=" << config.maxPending
     << " maxFinishedRecords=" << config.maxFinishedRecords
     << " verifySignatures=" << (config.verifySignatures ? "on" : "off");
  return os;
}

} // namespace hr
