/**
 * @file compliance_checker.h
 * @brief German calibration law (Eichrecht) compliance checks
 *
 * Checks never fail: they return a (possibly empty) list of issues with
 * explicit severities and leave the pass/fail policy to the caller.
 */

#pragma once

#include "ocmf/eichrecht/issue.h"
#include "ocmf/model/payload.h"
#include "ocmf/model/reading.h"
#include <vector>

namespace ocmf::eichrecht {

/**
 * @brief Configurable parts of the transaction check
 */
struct CompliancePolicy {
    /// Severity of an ID difference between begin and end record
    IssueSeverity idMismatchSeverity = IssueSeverity::WARNING;

    /// @brief Read OCMF_ID_MISMATCH_SEVERITY ("warning" or "error") from ConfigManager
    static CompliancePolicy fromConfig();
};

/**
 * @brief Check one billing-relevant reading
 *
 * - ST must be 'G' (METER_STATUS error)
 * - EF must be empty (ERROR_FLAGS error)
 * - TM should be synchronized (TIME_SYNC warning)
 * - CL must be 0 at transaction begin (CL_BEGIN error) and non-negative
 *   (CL_NEGATIVE error)
 *
 * @param reading Reading to check
 * @param isBegin Reading opens the transaction
 */
std::vector<EichrechtIssue> checkReading(const model::Reading& reading, bool isBegin);

/**
 * @brief Check a begin/end payload pair
 *
 * The billing-relevant readings are the first reading of `begin` and the
 * last reading of `end`. Missing readings short-circuit with NO_READINGS.
 *
 * Pagination counters must be consecutive. ID values are compared as given:
 * an absent ID and an empty ID differ and yield ID_MISMATCH with the
 * policy's severity.
 */
std::vector<EichrechtIssue> checkTransaction(const model::Payload& begin,
                                             const model::Payload& end,
                                             const CompliancePolicy& policy = {});

/**
 * @brief True if checkTransaction() reports no error-severity issue
 */
bool validateTransactionPair(const model::Payload& begin,
                             const model::Payload& end,
                             const CompliancePolicy& policy = {});

/// @brief Keep only error-severity issues
std::vector<EichrechtIssue> filterErrors(const std::vector<EichrechtIssue>& issues);

/// @brief True if any issue has error severity
bool hasErrors(const std::vector<EichrechtIssue>& issues);

} // namespace ocmf::eichrecht
