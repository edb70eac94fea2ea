/**
 * @file ocmf.h
 * @brief Record-level OCMF operations
 *
 * Convenience entry points combining the codec, the signature verifier and
 * the compliance checker on parsed records.
 */

#pragma once

#include "ocmf/codec/ocmf_codec.h"
#include "ocmf/common/error.h"
#include "ocmf/crypto/signature_verifier.h"
#include "ocmf/eichrecht/compliance_checker.h"
#include "ocmf/model/ocmf_record.h"
#include <string>
#include <vector>

namespace ocmf {

/**
 * @brief Verify the record's signature over its original payload text
 *
 * @param record Parsed record
 * @param publicKey Hex or base64 key; if empty, the embedded PK is used
 * @return true/false for a completed verification, VERIFICATION error if no
 *         key is available, decoding/key errors as returned by the verifier
 */
Result<bool> verifySignature(const model::OcmfRecord& record, const std::string& publicKey = "");

/**
 * @brief Eichrecht check of a single record or a transaction pair
 *
 * Single record: every reading is checked, the first one as a begin
 * reading if its TX is 'B'. An empty RD yields NO_READINGS.
 * Pair: checkTransaction(record, *other).
 *
 * @param record Record (begin record for a pair)
 * @param other End record, or nullptr
 * @param errorsOnly Drop warnings
 * @param policy Transaction check policy
 */
std::vector<eichrecht::EichrechtIssue> checkCompliance(
    const model::OcmfRecord& record,
    const model::OcmfRecord* other = nullptr,
    bool errorsOnly = false,
    const eichrecht::CompliancePolicy& policy = {});

/// @brief Single-record check yields no error-severity issue
bool isCompliant(const model::OcmfRecord& record);

/// @brief Begin/end records form a compliant transaction
bool validateTransactionPair(const model::OcmfRecord& begin,
                             const model::OcmfRecord& end,
                             const eichrecht::CompliancePolicy& policy = {});

/**
 * @brief Combined signature and compliance result
 */
struct VerificationResult {
    bool signatureValid = false;
    std::vector<eichrecht::EichrechtIssue> issues;
};

/**
 * @brief Verify signature and, optionally, compliance in one call
 *
 * @param record Record to verify
 * @param publicKey Key text (empty: embedded PK)
 * @param other Paired end record, or nullptr
 * @param checkEichrecht Run the compliance check
 * @return Result, or the error of verifySignature()
 */
Result<VerificationResult> verify(const model::OcmfRecord& record,
                                  const std::string& publicKey,
                                  const model::OcmfRecord* other = nullptr,
                                  bool checkEichrecht = true);

} // namespace ocmf
