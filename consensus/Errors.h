#ifndef HR_CONSENSUS_ERRORS_H
#define HR_CONSENSUS_ERRORS_H

#include "ResultOrError.hpp"
#include <string>

namespace hr {
namespace consensus {

/**
 * Error kinds shared by every consensus-facing component. The set is
 * closed; callers branch on the code, never on the message.
 */
struct ErrorKind {
  constexpr static int32_t VALIDATION = 1;
  constexpr static int32_t INVALID_TRANSACTION = 2;
  constexpr static int32_t NOT_LEADER = 3;
  constexpr static int32_t STALE_TERM = 4;
  constexpr static int32_t UNKNOWN_VOTER = 5;
  constexpr static int32_t BLOCK_NOT_FOUND = 6;
  constexpr static int32_t DUPLICATE_VOTE = 7;
  constexpr static int32_t QUORUM_TIMEOUT = 8;
  constexpr static int32_t BATCH_TOO_LARGE = 9;
  constexpr static int32_t EMPTY_BATCH = 10;
  constexpr static int32_t BUFFER_FULL = 11;
  constexpr static int32_t INTERNAL = 12;
};

// "ValidationError", "NotLeaderError", ...
std::string errorKindName(int32_t code);

struct Error : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;

  // Offending field for INVALID_TRANSACTION and VALIDATION errors, if any
  std::string field;

  static Error invalidTransaction(const std::string &field,
                                  const std::string &message) {
    Error error(ErrorKind::INVALID_TRANSACTION, field + ": " + message);
    error.field = field;
    return error;
  }
};

template <typename T> using Roe = ResultOrError<T, Error>;

} // namespace consensus
} // namespace hr

#endif // HR_CONSENSUS_ERRORS_H
