#include "Validation.h"

#include <cmath>
#include <set>

namespace hr {
namespace consensus {

namespace {

Error validationError(const std::string &field, const std::string &message) {
  Error error(ErrorKind::VALIDATION, field + ": " + message);
  error.field = field;
  return error;
}

} // namespace

Roe<void> checkTransactionFields(const Transaction &tx) {
  if (tx.id.empty()) {
    return Error::invalidTransaction("id", "must not be empty");
  }
  if (tx.type.empty()) {
    return Error::invalidTransaction("type", "must not be empty");
  }
  if (tx.fromAddress.empty()) {
    return Error::invalidTransaction("fromAddress", "must not be empty");
  }
  if (tx.toAddress.empty()) {
    return Error::invalidTransaction("toAddress", "must not be empty");
  }
  if (!std::isfinite(tx.amount) || tx.amount <= 0) {
    return Error::invalidTransaction("amount", "must be positive");
  }
  if (tx.timestamp <= 0) {
    return Error::invalidTransaction("timestamp", "must be positive");
  }
  return {};
}

Roe<void> checkBlockStructure(const Block &block) {
  if (block.hash.empty()) {
    return validationError("hash", "must not be empty");
  }
  if (block.height == 0) {
    return validationError("height", "must be positive");
  }
  if (block.height > 1 && block.previousHash.empty()) {
    return validationError("previousHash", "must not be empty above height 1");
  }
  if (block.validator.empty()) {
    return validationError("validator", "must not be empty");
  }
  if (block.timestamp <= 0) {
    return validationError("timestamp", "must be positive");
  }

  std::set<std::string> ids;
  for (const auto &tx : block.transactions) {
    auto result = checkTransactionFields(tx);
    if (!result) {
      return validationError("transactions",
                             "transaction '" + tx.id + "' " +
                                 result.error().message);
    }
    if (!ids.insert(tx.id).second) {
      return validationError("transactions", "duplicate transaction id '" +
                                                 tx.id + "'");
    }
  }
  return {};
}

} // namespace consensus
} // namespace hr
