#pragma once

#include "Errors.h"
#include "Types.hpp"

namespace hr {
namespace consensus {

/**
 * Structural checks on a transaction, in order: id, type, fromAddress,
 * toAddress, amount, timestamp. Fails with INVALID_TRANSACTION naming the
 * first offending field.
 */
Roe<void> checkTransactionFields(const Transaction &tx);

/**
 * Structural checks on a proposed block, in order: hash, height,
 * previousHash (above height 1), validator, timestamp, then every
 * transaction (fields and unique ids). Fails with VALIDATION naming the
 * first violated rule.
 */
Roe<void> checkBlockStructure(const Block &block);

} // namespace consensus
} // namespace hr
