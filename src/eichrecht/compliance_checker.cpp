/**
 * @file compliance_checker.cpp
 * @brief Eichrecht compliance check implementation
 */

#include "ocmf/eichrecht/compliance_checker.h"
#include "ocmf/common/config_manager.h"
#include "ocmf/utils/string_utils.h"
#include <algorithm>
#include <iterator>

namespace ocmf::eichrecht {

namespace {

EichrechtIssue makeIssue(IssueCode code, const std::string& message, const std::string& field,
                         IssueSeverity severity = IssueSeverity::ERROR) {
    EichrechtIssue issue;
    issue.code = code;
    issue.message = message;
    issue.field = field;
    issue.severity = severity;
    return issue;
}

std::string orNone(const std::optional<std::string>& value) {
    return value ? *value : "None";
}

} // namespace

CompliancePolicy CompliancePolicy::fromConfig() {
    CompliancePolicy policy;
    std::string severity = utils::toLower(common::ConfigManager::getInstance().getString(
        common::ConfigManager::ID_MISMATCH_SEVERITY, "warning"));
    if (severity == "error") {
        policy.idMismatchSeverity = IssueSeverity::ERROR;
    }
    return policy;
}

std::vector<EichrechtIssue> checkReading(const model::Reading& reading, bool isBegin) {
    std::vector<EichrechtIssue> issues;

    if (reading.status != model::MeterStatus::OK) {
        issues.push_back(makeIssue(IssueCode::METER_STATUS,
            "Meter status must be 'G' (OK) for billing-relevant readings, got '" +
            model::toString(reading.status) + "'", "ST"));
    }

    if (reading.errorFlags && !utils::trim(*reading.errorFlags).empty()) {
        issues.push_back(makeIssue(IssueCode::ERROR_FLAGS,
            "Error flags must be empty for billing-relevant readings, got '" +
            *reading.errorFlags + "'", "EF"));
    }

    if (!reading.time.isSynchronized()) {
        issues.push_back(makeIssue(IssueCode::TIME_SYNC,
            "Time should be synchronized (status 'S') for billing, got '" +
            model::toString(reading.time.status) + "'", "TM", IssueSeverity::WARNING));
    }

    if (reading.cumulatedLoss) {
        double cl = *reading.cumulatedLoss;
        if (isBegin && cl != 0.0) {
            issues.push_back(makeIssue(IssueCode::CL_BEGIN,
                "Cumulated loss (CL) must be 0 at transaction begin, got " +
                utils::formatDecimal(cl), "CL"));
        }
        if (cl < 0.0) {
            issues.push_back(makeIssue(IssueCode::CL_NEGATIVE,
                "Cumulated loss (CL) must be non-negative, got " + utils::formatDecimal(cl), "CL"));
        }
    }

    return issues;
}

std::vector<EichrechtIssue> checkTransaction(const model::Payload& begin,
                                             const model::Payload& end,
                                             const CompliancePolicy& policy) {
    std::vector<EichrechtIssue> issues;

    // 1. Readings
    if (begin.readings.empty() || end.readings.empty()) {
        issues.push_back(makeIssue(IssueCode::NO_READINGS,
            "Both begin and end payloads must contain readings (RD)", "RD"));
        return issues;
    }

    // 2. Billing-relevant readings
    const model::Reading& beginReading = begin.readings.front();
    const model::Reading& endReading = end.readings.back();
    const size_t endIndex = end.readings.size() - 1;

    // 3. Transaction types
    if (!beginReading.isBegin()) {
        issues.push_back(makeIssue(IssueCode::BEGIN_TX,
            "Begin reading must have TX='B', got '" +
            (beginReading.reason ? model::toString(*beginReading.reason) : "None") + "'",
            "RD[0].TX"));
    }

    if (!endReading.isEnd()) {
        issues.push_back(makeIssue(IssueCode::END_TX,
            "'" + (endReading.reason ? model::toString(*endReading.reason) : "None") +
            "' is not a valid end reading type",
            "RD[" + std::to_string(endIndex) + "].TX"));
    }

    // 4. Individual readings
    auto beginIssues = checkReading(beginReading, true);
    issues.insert(issues.end(), beginIssues.begin(), beginIssues.end());
    auto endIssues = checkReading(endReading, false);
    issues.insert(issues.end(), endIssues.begin(), endIssues.end());

    // 5. Serial numbers
    auto beginSerial = begin.serialNumber();
    auto endSerial = end.serialNumber();
    if (beginSerial != endSerial) {
        issues.push_back(makeIssue(IssueCode::SERIAL_MISMATCH,
            "Serial numbers must match: begin='" + orNone(beginSerial) +
            "', end='" + orNone(endSerial) + "'", "GS/MS"));
    }

    // 6. OBIS codes
    std::optional<std::string> beginObis;
    std::optional<std::string> endObis;
    if (beginReading.obis) beginObis = beginReading.obis->toString();
    if (endReading.obis) endObis = endReading.obis->toString();
    if (beginObis != endObis) {
        issues.push_back(makeIssue(IssueCode::OBIS_MISMATCH,
            "OBIS codes must match: begin='" + orNone(beginObis) +
            "', end='" + orNone(endObis) + "'", "RI"));
    }

    // 7. Units
    if (beginReading.unit != endReading.unit) {
        issues.push_back(makeIssue(IssueCode::UNIT_MISMATCH,
            "Units must match: begin='" +
            (beginReading.unit ? model::toString(*beginReading.unit) : "None") + "', end='" +
            (endReading.unit ? model::toString(*endReading.unit) : "None") + "'", "RU"));
    }

    // 8. Value progression
    if (beginReading.value && endReading.value && *endReading.value < *beginReading.value) {
        issues.push_back(makeIssue(IssueCode::VALUE_REGRESSION,
            "End value (" + utils::formatDecimal(*endReading.value) +
            ") must be >= begin value (" + utils::formatDecimal(*beginReading.value) + ")", "RV"));
    }

    // 9. Timestamp ordering
    if (endReading.time.compareInstant(beginReading.time) < 0) {
        issues.push_back(makeIssue(IssueCode::TIME_REGRESSION,
            "End timestamp (" + endReading.time.toString() +
            ") must be >= begin timestamp (" + beginReading.time.toString() + ")", "TM"));
    }

    // 10. Identification level
    for (const auto* side : {&begin, &end}) {
        if (side->identificationLevel && model::isErrorState(*side->identificationLevel)) {
            issues.push_back(makeIssue(IssueCode::ID_LEVEL_INVALID,
                std::string(side == &begin ? "Begin" : "End") +
                " identification level indicates a failed identification: '" +
                model::toString(*side->identificationLevel) + "'", "IL"));
        }
    }

    // 11. Pagination
    if (!begin.pagination.isFollowedBy(end.pagination)) {
        issues.push_back(makeIssue(IssueCode::PAGINATION_INCONSISTENT,
            "Pagination must be consecutive: begin='" + begin.pagination.toString() +
            "', end='" + end.pagination.toString() + "'", "PG"));
    }

    // 12. Identification data
    const auto& beginId = begin.identification.value;
    const auto& endId = end.identification.value;
    if (beginId != endId) {
        issues.push_back(makeIssue(IssueCode::ID_MISMATCH,
            "Identification data should match: begin='" + orNone(beginId) +
            "', end='" + orNone(endId) + "'",
            "ID", policy.idMismatchSeverity));
    }

    return issues;
}

bool validateTransactionPair(const model::Payload& begin,
                             const model::Payload& end,
                             const CompliancePolicy& policy) {
    return !hasErrors(checkTransaction(begin, end, policy));
}

std::vector<EichrechtIssue> filterErrors(const std::vector<EichrechtIssue>& issues) {
    std::vector<EichrechtIssue> errors;
    std::copy_if(issues.begin(), issues.end(), std::back_inserter(errors),
                 [](const EichrechtIssue& issue) { return issue.isError(); });
    return errors;
}

bool hasErrors(const std::vector<EichrechtIssue>& issues) {
    return std::any_of(issues.begin(), issues.end(),
                       [](const EichrechtIssue& issue) { return issue.isError(); });
}

} // namespace ocmf::eichrecht
