#include "Errors.h"

namespace hr {
namespace consensus {

std::string errorKindName(int32_t code) {
  switch (code) {
  case ErrorKind::VALIDATION:
    return "ValidationError";
  case ErrorKind::INVALID_TRANSACTION:
    return "InvalidTransactionError";
  case ErrorKind::NOT_LEADER:
    return "NotLeaderError";
  case ErrorKind::STALE_TERM:
    return "StaleTermError";
  case ErrorKind::UNKNOWN_VOTER:
    return "UnknownVoterError";
  case ErrorKind::BLOCK_NOT_FOUND:
    return "BlockNotFoundError";
  case ErrorKind::DUPLICATE_VOTE:
    return "DuplicateVoteError";
  case ErrorKind::QUORUM_TIMEOUT:
    return "QuorumTimeoutError";
  case ErrorKind::BATCH_TOO_LARGE:
    return "BatchTooLargeError";
  case ErrorKind::EMPTY_BATCH:
    return "EmptyBatchError";
  case ErrorKind::BUFFER_FULL:
    return "BufferFullError";
  case ErrorKind::INTERNAL:
  default:
    return "InternalError";
  }
}

} // namespace consensus
} // namespace hr
