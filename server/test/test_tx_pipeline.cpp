#include "../TxPipeline.h"
#include "Utilities.h"
#include <gtest/gtest.h>

using namespace hr;
using consensus::Block;
using consensus::ErrorKind;
using consensus::Transaction;
using consensus::TxStatus;

namespace {

Transaction makeTx(const std::string &id, uint64_t nonce = 0,
                   const std::string &from = "alice") {
  Transaction tx;
  tx.id = id;
  tx.type = "transfer";
  tx.fromAddress = from;
  tx.toAddress = "bob";
  tx.amount = 10;
  tx.timestamp = 1000;
  tx.nonce = nonce;
  return tx;
}

std::vector<std::string> idsOf(const std::vector<Transaction> &txs) {
  std::vector<std::string> ids;
  for (const auto &tx : txs) {
    ids.push_back(tx.id);
  }
  return ids;
}

} // namespace

class TxPipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    TxPipeline::Config config;
    config.batchSize = 3;
    config.batchTimeoutMs = 100;
    config.maxBatchSize = 5;
    config.maxRetries = 1;
    config.maxPending = 10;
    pipeline.init(config);
  }

  TxPipeline pipeline;
};

TEST_F(TxPipelineTest, SubmitReturnsReceiptWithHash) {
  auto tx = makeTx("t1");
  auto receipt = pipeline.submit(tx, 0);
  ASSERT_TRUE(receipt.isOk()) << receipt.error().message;
  EXPECT_EQ(receipt->id, "t1");
  EXPECT_EQ(receipt->hash, tx.computeHash());
  EXPECT_EQ(pipeline.getPendingCount(), 1u);

  auto record = pipeline.getRecord("t1");
  ASSERT_TRUE(record.isOk());
  EXPECT_EQ(record->status, TxStatus::PENDING);
}

TEST_F(TxPipelineTest, SubmitRejectsInvalidField) {
  auto tx = makeTx("t1");
  tx.amount = 0;
  auto receipt = pipeline.submit(tx, 0);
  ASSERT_TRUE(receipt.isError());
  EXPECT_EQ(receipt.error().code, ErrorKind::INVALID_TRANSACTION);
  EXPECT_EQ(receipt.error().field, "amount");
  EXPECT_EQ(pipeline.getPendingCount(), 0u);
}

TEST_F(TxPipelineTest, SubmitRejectsDuplicateId) {
  ASSERT_TRUE(pipeline.submit(makeTx("t1"), 0).isOk());
  auto again = pipeline.submit(makeTx("t1"), 0);
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().field, "id");
}

TEST_F(TxPipelineTest, NonceMustIncreasePerSender) {
  ASSERT_TRUE(pipeline.submit(makeTx("t1", 5), 0).isOk());
  auto replay = pipeline.submit(makeTx("t2", 5), 0);
  ASSERT_TRUE(replay.isError());
  EXPECT_EQ(replay.error().field, "nonce");

  EXPECT_TRUE(pipeline.submit(makeTx("t3", 6), 0).isOk());
  // Other senders are independent
  EXPECT_TRUE(pipeline.submit(makeTx("t4", 1, "carol"), 0).isOk());
}

TEST_F(TxPipelineTest, NonceZeroAfterSequencedNonceIsRejected) {
  ASSERT_TRUE(pipeline.submit(makeTx("t1", 5), 0).isOk());
  auto reset = pipeline.submit(makeTx("t2", 0), 0);
  ASSERT_TRUE(reset.isError());
  EXPECT_EQ(reset.error().code, ErrorKind::INVALID_TRANSACTION);
  EXPECT_EQ(reset.error().field, "nonce");
}

TEST_F(TxPipelineTest, UnsequencedSenderMayRepeatNonceZero) {
  EXPECT_TRUE(pipeline.submit(makeTx("t1", 0, "dave"), 0).isOk());
  EXPECT_TRUE(pipeline.submit(makeTx("t2", 0, "dave"), 0).isOk());
  // The first sequenced nonce closes the exemption
  EXPECT_TRUE(pipeline.submit(makeTx("t3", 1, "dave"), 0).isOk());
  auto after = pipeline.submit(makeTx("t4", 0, "dave"), 0);
  ASSERT_TRUE(after.isError());
  EXPECT_EQ(after.error().field, "nonce");
}

TEST_F(TxPipelineTest, SubmitFailsWhenQueueFull) {
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(pipeline.submit(makeTx("t" + std::to_string(i)), 0).isOk());
  }
  auto full = pipeline.submit(makeTx("overflow"), 0);
  ASSERT_TRUE(full.isError());
  EXPECT_EQ(full.error().code, ErrorKind::BUFFER_FULL);
}

TEST_F(TxPipelineTest, SubmitBatchReportsPerItemErrors) {
  auto bad = makeTx("t2");
  bad.toAddress.clear();
  auto result = pipeline.submitBatch({ makeTx("t1"), bad, makeTx("t3") }, 0);
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result->accepted, 2u);
  EXPECT_EQ(result->rejected, 1u);
  ASSERT_EQ(result->errors.size(), 1u);
  EXPECT_EQ(result->errors[0].index, 1u);
  EXPECT_EQ(result->errors[0].id, "t2");
  EXPECT_EQ(result->errors[0].error.field, "toAddress");
  ASSERT_EQ(result->receipts.size(), 2u);
  EXPECT_EQ(result->receipts[1].id, "t3");
}

TEST_F(TxPipelineTest, SubmitBatchRejectsEmptyAndOversized) {
  auto empty = pipeline.submitBatch({}, 0);
  ASSERT_TRUE(empty.isError());
  EXPECT_EQ(empty.error().code, ErrorKind::EMPTY_BATCH);

  std::vector<Transaction> txs;
  for (int i = 0; i < 6; ++i) {
    txs.push_back(makeTx("t" + std::to_string(i)));
  }
  auto large = pipeline.submitBatch(txs, 0);
  ASSERT_TRUE(large.isError());
  EXPECT_EQ(large.error().code, ErrorKind::BATCH_TOO_LARGE);
  EXPECT_EQ(pipeline.getRecordCount(), 0u);
}

TEST_F(TxPipelineTest, BatchReadyBySizeOrTimeout) {
  ASSERT_TRUE(pipeline.submit(makeTx("t1"), 0).isOk());
  EXPECT_FALSE(pipeline.isBatchReady(50));
  EXPECT_TRUE(pipeline.takeBatch(50).empty());
  EXPECT_TRUE(pipeline.isBatchReady(100));

  ASSERT_TRUE(pipeline.submit(makeTx("t2"), 60).isOk());
  ASSERT_TRUE(pipeline.submit(makeTx("t3"), 60).isOk());
  EXPECT_TRUE(pipeline.isBatchReady(60));
}

TEST_F(TxPipelineTest, TakeBatchPreservesArrivalOrder) {
  for (int i = 1; i <= 4; ++i) {
    ASSERT_TRUE(pipeline.submit(makeTx("t" + std::to_string(i)), i).isOk());
  }
  auto batch = pipeline.takeBatch(10);
  EXPECT_EQ(idsOf(batch), (std::vector<std::string>{ "t1", "t2", "t3" }));
  EXPECT_EQ(pipeline.getPendingCount(), 1u);
  EXPECT_EQ(pipeline.getRecord("t1")->status, TxStatus::INCLUDED);
}

TEST_F(TxPipelineTest, FinalizedBlockConfirmsTransactions) {
  for (int i = 1; i <= 3; ++i) {
    ASSERT_TRUE(pipeline.submit(makeTx("t" + std::to_string(i)), 0).isOk());
  }
  auto batch = pipeline.takeBatch(0);
  ASSERT_EQ(batch.size(), 3u);

  Block block;
  block.height = 1;
  block.hash = "h1";
  block.transactions = batch;
  pipeline.markIncluded(idsOf(batch), block.hash, block.height);
  EXPECT_EQ(pipeline.getRecord("t2")->blockHash, "h1");

  EXPECT_EQ(pipeline.onFinalized(block), 3u);
  auto record = pipeline.getRecord("t2");
  ASSERT_TRUE(record.isOk());
  EXPECT_EQ(record->status, TxStatus::CONFIRMED);
  EXPECT_EQ(record->blockHeight, 1u);
  // A second notification changes nothing
  EXPECT_EQ(pipeline.onFinalized(block), 0u);
}

TEST_F(TxPipelineTest, FinalizedBlockFromPeerCreatesRecords) {
  Block block;
  block.height = 4;
  block.hash = "h4";
  block.timestamp = 500;
  block.transactions.push_back(makeTx("remote", 9));
  EXPECT_EQ(pipeline.onFinalized(block), 1u);
  EXPECT_EQ(pipeline.getRecord("remote")->status, TxStatus::CONFIRMED);

  // The confirmed nonce now bounds later submissions
  auto stale = pipeline.submit(makeTx("local", 9), 0);
  ASSERT_TRUE(stale.isError());
  EXPECT_EQ(stale.error().field, "nonce");
}

TEST_F(TxPipelineTest, AbortedBlockRequeuesAtFront) {
  for (int i = 1; i <= 4; ++i) {
    ASSERT_TRUE(pipeline.submit(makeTx("t" + std::to_string(i)), 0).isOk());
  }
  auto batch = pipeline.takeBatch(0);
  pipeline.onAborted(idsOf(batch), "rejected");

  EXPECT_EQ(pipeline.getPendingCount(), 4u);
  auto record = pipeline.getRecord("t1");
  EXPECT_EQ(record->status, TxStatus::PENDING);
  EXPECT_EQ(record->attempts, 1u);
  EXPECT_EQ(record->lastError, "rejected");

  auto again = pipeline.takeBatch(0);
  EXPECT_EQ(idsOf(again), (std::vector<std::string>{ "t1", "t2", "t3" }));
}

TEST_F(TxPipelineTest, TransactionFailsAfterMaxRetries) {
  ASSERT_TRUE(pipeline.submit(makeTx("t1"), 0).isOk());
  pipeline.onAborted(idsOf(pipeline.takeBatch(100)), "expired");
  EXPECT_EQ(pipeline.getRecord("t1")->status, TxStatus::PENDING);

  pipeline.onAborted(idsOf(pipeline.takeBatch(100)), "expired");
  EXPECT_EQ(pipeline.getRecord("t1")->status, TxStatus::FAILED);
  EXPECT_EQ(pipeline.getPendingCount(), 0u);
  EXPECT_TRUE(pipeline.takeBatch(1000).empty());
}

TEST_F(TxPipelineTest, UnknownTransactionLookupFails) {
  auto record = pipeline.getRecord("missing");
  ASSERT_TRUE(record.isError());
  EXPECT_EQ(record.error().code, ErrorKind::VALIDATION);
}

TEST_F(TxPipelineTest, RestoreConfirmedMarksReplayedBlock) {
  Block block;
  block.height = 1;
  block.hash = "h1";
  block.transactions.push_back(makeTx("old", 3));
  pipeline.restoreConfirmed(block);
  EXPECT_EQ(pipeline.getRecord("old")->status, TxStatus::CONFIRMED);
  EXPECT_EQ(pipeline.getPendingCount(), 0u);

  auto dup = pipeline.submit(makeTx("old", 4), 0);
  ASSERT_TRUE(dup.isError());
  EXPECT_EQ(dup.error().field, "id");
}

TEST(TxPipelineRetentionTest, EvictedIdsStayUnique) {
  TxPipeline pipeline;
  TxPipeline::Config config;
  config.maxFinishedRecords = 2;
  pipeline.init(config);

  Block block;
  block.height = 1;
  block.hash = "h1";
  for (int i = 0; i < 5; ++i) {
    block.transactions.push_back(
        makeTx("tx-" + std::to_string(i), 0, "sender" + std::to_string(i)));
  }
  pipeline.restoreConfirmed(block);
  EXPECT_EQ(pipeline.getRecordCount(), 2u);
  EXPECT_TRUE(pipeline.getRecord("tx-0").isError());
  EXPECT_TRUE(pipeline.isKnown("tx-0"));

  auto again = pipeline.submit(makeTx("tx-0", 0, "sender0"), 0);
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, ErrorKind::INVALID_TRANSACTION);
  EXPECT_EQ(again.error().field, "id");

  // Replaying the same block does not resurrect evicted records
  EXPECT_EQ(pipeline.onFinalized(block), 0u);
  EXPECT_EQ(pipeline.getRecordCount(), 2u);
}

TEST(TxPipelineRetentionTest, EvictedFailedIdsStayUnique) {
  TxPipeline pipeline;
  TxPipeline::Config config;
  config.batchSize = 1;
  config.maxRetries = 0;
  config.maxFinishedRecords = 1;
  pipeline.init(config);

  for (const std::string id : { "a", "b" }) {
    ASSERT_TRUE(pipeline.submit(makeTx(id, 0, "s-" + id), 0).isOk());
    pipeline.onAborted(idsOf(pipeline.takeBatch(0)), "rejected");
  }
  EXPECT_TRUE(pipeline.getRecord("a").isError());
  EXPECT_EQ(pipeline.getRecord("b")->status, TxStatus::FAILED);

  auto again = pipeline.submit(makeTx("a", 0, "s-a"), 0);
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().field, "id");
}

TEST(TxPipelineSignatureTest, VerifiesEd25519Signatures) {
  TxPipeline pipeline;
  TxPipeline::Config config;
  config.verifySignatures = true;
  pipeline.init(config);

  auto keys = utl::ed25519Generate();
  ASSERT_TRUE(keys.isOk());
  auto tx = makeTx("signed", 1, utl::hexEncode(keys->publicKey));
  auto signature = utl::ed25519Sign(keys->privateKey, tx.canonical());
  ASSERT_TRUE(signature.isOk());
  tx.signature = utl::hexEncode(*signature);
  EXPECT_TRUE(pipeline.submit(tx, 0).isOk());

  auto forged = makeTx("forged", 2, utl::hexEncode(keys->publicKey));
  forged.signature = tx.signature;
  auto result = pipeline.submit(forged, 0);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().field, "signature");

  auto unsignedTx = makeTx("plain", 3);
  auto plain = pipeline.submit(unsignedTx, 0);
  ASSERT_TRUE(plain.isError());
  EXPECT_EQ(plain.error().field, "fromAddress");
}
