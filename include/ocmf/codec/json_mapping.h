/**
 * @file json_mapping.h
 * @brief jsoncpp <-> OCMF model mapping
 *
 * Mapping performs the structural checks (required keys, JSON types, enum
 * tokens, timestamp/OBIS/pagination syntax). Cross-field rules live in
 * model::validatePayload() and model::validateSignature().
 */

#pragma once

#include "ocmf/common/error.h"
#include "ocmf/model/payload.h"
#include "ocmf/model/signature.h"
#include <json/json.h>
#include <string>

namespace ocmf::codec {

/**
 * @brief Parse JSON text into a single object
 *
 * Strict: one root object, no trailing content, no duplicate keys.
 *
 * @return Object, or FORMAT error
 */
Result<Json::Value> parseJsonObject(const std::string& text);

/**
 * @brief Compact JSON text (no whitespace, keys sorted by jsoncpp)
 */
std::string writeCompactJson(const Json::Value& value);

/**
 * @brief Fill absent TM, TX, RI, RU, RT, EF and ST from the previous reading
 *
 * @param readings RD array (entries that are not objects are left untouched)
 * @return New RD array
 */
Json::Value applyReadingInheritance(const Json::Value& readings);

/**
 * @brief Map a payload object (inheritance is applied first)
 * @return Payload, or VALIDATION error naming the offending field
 */
Result<model::Payload> payloadFromJson(const Json::Value& root);

/**
 * @brief Map a signature object (unknown keys are ignored)
 * @return Signature, or VALIDATION error naming the offending field
 */
Result<model::Signature> signatureFromJson(const Json::Value& root);

/// @brief Payload to JSON, absent fields omitted
Json::Value payloadToJson(const model::Payload& payload);

/// @brief Reading to JSON, absent fields omitted
Json::Value readingToJson(const model::Reading& reading);

/// @brief Signature to JSON, absent fields omitted
Json::Value signatureToJson(const model::Signature& signature);

} // namespace ocmf::codec
