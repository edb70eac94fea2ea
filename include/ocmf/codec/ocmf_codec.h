/**
 * @file ocmf_codec.h
 * @brief OCMF wire codec: "OCMF|<payload>|<signature>" <-> OcmfRecord
 */

#pragma once

#include "ocmf/common/error.h"
#include "ocmf/model/ocmf_record.h"
#include "ocmf/model/payload.h"
#include <string>

namespace ocmf::codec {

/// @brief Section separator
constexpr char SEPARATOR = '|';

/// @brief Prefix of every plain (non-hex) OCMF string
constexpr const char* PREFIX = "OCMF|";

/**
 * @brief Parse an OCMF string
 *
 * Steps:
 *   1. Trim surrounding whitespace
 *   2. If the text does not start with "OCMF|", hex-decode it and require
 *      valid UTF-8 (HEX_DECODING error otherwise)
 *   3. Split on '|' into at most three parts; require "OCMF" as the first
 *      part (FORMAT error otherwise)
 *   4. Map and validate the payload (PAYLOAD error wrapping the cause)
 *   5. Map and validate the signature (SIGNATURE error wrapping the cause)
 *
 * The payload text between the first two separators is kept verbatim in the
 * record for signature verification.
 *
 * @param input Plain or hex-encoded OCMF string
 * @param options Payload validation policy
 * @return Record or error
 */
Result<model::OcmfRecord> parse(const std::string& input,
                                const model::ValidationOptions& options = {});

/**
 * @brief Serialize a record as compact JSON sections
 *
 * The result is value-identical to the parsed input but not necessarily
 * byte-identical (key order, number formatting). Never use it to rebuild
 * the signed payload bytes.
 *
 * @param record Record to encode
 * @param hex Hex-encode the whole string (lowercase)
 */
std::string serialize(const model::OcmfRecord& record, bool hex = false);

} // namespace ocmf::codec
