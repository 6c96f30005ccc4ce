#ifndef HR_TX_PIPELINE_H
#define HR_TX_PIPELINE_H

#include "../consensus/Errors.h"
#include "../consensus/Types.hpp"
#include "../lib/Module.h"

#include <deque>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace hr {

/**
 * TxPipeline - admits client transactions and hands them to consensus in
 * arrival order.
 *
 * Lifecycle of a record:
 *   PENDING -> INCLUDED (taken into a proposed block) -> CONFIRMED
 *   INCLUDED -> PENDING (block rejected or expired, back to the queue front)
 *   INCLUDED -> FAILED (aborted more than maxRetries times)
 *
 * Owned by the single consensus writer, not synchronized.
 */
class TxPipeline : public Module {
public:
  using Error = consensus::Error;
  using ErrorKind = consensus::ErrorKind;
  template <typename T> using Roe = consensus::Roe<T>;

  struct Config {
    size_t batchSize{ DEFAULT_BATCH_SIZE };
    int64_t batchTimeoutMs{ DEFAULT_BATCH_TIMEOUT_MS };
    size_t maxBatchSize{ DEFAULT_MAX_BATCH_SIZE };
    uint32_t maxRetries{ DEFAULT_MAX_RETRIES };
    size_t maxPending{ DEFAULT_MAX_PENDING };
    size_t maxFinishedRecords{ DEFAULT_MAX_FINISHED_RECORDS };
    bool verifySignatures{ false };
  };

  constexpr static size_t DEFAULT_BATCH_SIZE = 100;
  constexpr static int64_t DEFAULT_BATCH_TIMEOUT_MS = 1000;
  constexpr static size_t DEFAULT_MAX_BATCH_SIZE = 10000;
  constexpr static uint32_t DEFAULT_MAX_RETRIES = 3;
  constexpr static size_t DEFAULT_MAX_PENDING = 100000;
  // Confirmed and failed records kept in full for lookup
  constexpr static size_t DEFAULT_MAX_FINISHED_RECORDS = 100000;

  struct Receipt {
    std::string id;
    std::string hash;
  };

  struct BatchItemError {
    size_t index{ 0 };
    std::string id;
    Error error;
  };

  struct BatchResult {
    size_t accepted{ 0 };
    size_t rejected{ 0 };
    std::vector<Receipt> receipts;
    std::vector<BatchItemError> errors;
  };

  struct Record {
    consensus::Transaction tx;
    std::string hash;
    consensus::TxStatus status{ consensus::TxStatus::PENDING };
    uint32_t attempts{ 0 }; // aborted blocks that carried this transaction
    int64_t submittedAtMs{ 0 };
    std::string blockHash;
    uint64_t blockHeight{ 0 };
    std::string lastError;
  };

  TxPipeline();
  ~TxPipeline() override = default;

  // ----- accessors -----
  const Config &getConfig() const { return config_; }
  size_t getPendingCount() const { return pendingCount_; }
  size_t getRecordCount() const { return records_.size(); }
  bool isKnown(const std::string &txId) const;
  Roe<Record> getRecord(const std::string &txId) const;

  /**
   * A batch is ready when batchSize transactions are pending or the oldest
   * pending one has waited batchTimeoutMs
   */
  bool isBatchReady(int64_t nowMs) const;

  // ----- methods -----
  void init(const Config &config);

  /**
   * Validate and enqueue one transaction
   */
  Roe<Receipt> submit(const consensus::Transaction &tx, int64_t nowMs);

  /**
   * Submit transactions one by one. The batch as a whole fails only when it
   * is empty or larger than maxBatchSize, in which case nothing is enqueued.
   */
  Roe<BatchResult> submitBatch(const std::vector<consensus::Transaction> &txs,
                               int64_t nowMs);

  /**
   * Up to batchSize pending transactions in arrival order, marked INCLUDED.
   * Empty when no batch is ready.
   */
  std::vector<consensus::Transaction> takeBatch(int64_t nowMs);

  /**
   * Attach the proposed block to transactions taken with takeBatch()
   */
  void markIncluded(const std::vector<std::string> &txIds,
                    const std::string &blockHash, uint64_t blockHeight);

  /**
   * Confirm every transaction of a finalized block
   * @return Number of transactions that became CONFIRMED
   */
  size_t onFinalized(const consensus::Block &block);

  /**
   * Return transactions of an aborted block to the front of the queue in
   * their original order, or fail them once maxRetries is exceeded
   */
  void onAborted(const std::vector<std::string> &txIds,
                 const std::string &reason);

  /**
   * Mark transactions of an already finalized block as confirmed on restart
   */
  void restoreConfirmed(const consensus::Block &block);

private:
  Roe<void> validate(const consensus::Transaction &tx) const;
  void finish(const std::string &txId);
  size_t confirm(const consensus::Block &block);

  Config config_;
  std::map<std::string, Record> records_;
  std::deque<std::string> queue_; // may hold ids no longer PENDING
  std::deque<std::string> finished_;
  std::set<std::string> retiredIds_; // finished ids whose records were evicted
  std::map<std::string, uint64_t> lastNonce_;
  size_t pendingCount_{ 0 };
};

std::ostream &operator<<(std::ostream &os, const TxPipeline::Config &config);

} // namespace hr

#endif // HR_TX_PIPELINE_H
