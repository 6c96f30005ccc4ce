#ifndef HR_JSON_CODEC_H
#define HR_JSON_CODEC_H

#include "ConsensusNode.h"
#include "EventHub.h"
#include "TxPipeline.h"
#include "../consensus/Errors.h"
#include "../consensus/Types.hpp"

#include <nlohmann/json.hpp>

namespace hr {
namespace codec {

/**
 * Wire representation of the core types. Keys are snake_case.
 *
 * The *FromJson functions check presence and JSON types of fields (and the
 * ranges of integers) only; semantic checks stay with the core components.
 * Transaction fields fail with INVALID_TRANSACTION, everything else with
 * VALIDATION, in both cases naming the field.
 */

nlohmann::json toJson(const consensus::Transaction &tx);
nlohmann::json toJson(const consensus::Block &block);
nlohmann::json toJson(const consensus::Node &node);
nlohmann::json toJson(const consensus::ConsensusEvent &event);
nlohmann::json toJson(const TxPipeline::Record &record);
nlohmann::json toJson(const ConsensusNode::Status &status);

consensus::Roe<consensus::Transaction>
transactionFromJson(const nlohmann::json &j);
consensus::Roe<consensus::Block> blockFromJson(const nlohmann::json &j);
consensus::Roe<consensus::Node> nodeFromJson(const nlohmann::json &j);

/**
 * Field readers for request handlers. An absent or null optional field
 * leaves the output untouched; a wrong type fails with the given kind.
 */
consensus::Roe<void> readString(const nlohmann::json &j, const std::string &key,
                                std::string &out, bool required,
                                int32_t kind = consensus::ErrorKind::VALIDATION);
consensus::Roe<void> readUInt(const nlohmann::json &j, const std::string &key,
                              uint64_t &out, bool required,
                              int32_t kind = consensus::ErrorKind::VALIDATION);
consensus::Roe<void> readInt(const nlohmann::json &j, const std::string &key,
                             int64_t &out, bool required,
                             int32_t kind = consensus::ErrorKind::VALIDATION);
consensus::Roe<void> readNumber(const nlohmann::json &j, const std::string &key,
                                double &out, bool required,
                                int32_t kind = consensus::ErrorKind::VALIDATION);
consensus::Roe<void> readBool(const nlohmann::json &j, const std::string &key,
                              bool &out, bool required,
                              int32_t kind = consensus::ErrorKind::VALIDATION);

} // namespace codec
} // namespace hr

#endif // HR_JSON_CODEC_H
