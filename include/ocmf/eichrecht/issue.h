/**
 * @file issue.h
 * @brief Eichrecht compliance issue types
 */

#pragma once

#include <optional>
#include <string>

namespace ocmf::eichrecht {

/**
 * @brief Severity of a compliance issue
 */
enum class IssueSeverity {
    ERROR,    // Reading is not usable for billing
    WARNING   // Informational
};

inline std::string toString(IssueSeverity severity) {
    return severity == IssueSeverity::ERROR ? "error" : "warning";
}

/**
 * @brief Compliance issue codes
 */
enum class IssueCode {
    // Reading level
    METER_STATUS,
    ERROR_FLAGS,
    TIME_SYNC,
    CL_BEGIN,
    CL_NEGATIVE,

    // Transaction level
    NO_READINGS,
    BEGIN_TX,
    END_TX,
    SERIAL_MISMATCH,
    OBIS_MISMATCH,
    UNIT_MISMATCH,
    VALUE_REGRESSION,
    TIME_REGRESSION,
    ID_LEVEL_INVALID,
    PAGINATION_INCONSISTENT,
    ID_MISMATCH
};

inline std::string toString(IssueCode code) {
    switch (code) {
        case IssueCode::METER_STATUS:            return "METER_STATUS";
        case IssueCode::ERROR_FLAGS:             return "ERROR_FLAGS";
        case IssueCode::TIME_SYNC:               return "TIME_SYNC";
        case IssueCode::CL_BEGIN:                return "CL_BEGIN";
        case IssueCode::CL_NEGATIVE:             return "CL_NEGATIVE";
        case IssueCode::NO_READINGS:             return "NO_READINGS";
        case IssueCode::BEGIN_TX:                return "BEGIN_TX";
        case IssueCode::END_TX:                  return "END_TX";
        case IssueCode::SERIAL_MISMATCH:         return "SERIAL_MISMATCH";
        case IssueCode::OBIS_MISMATCH:           return "OBIS_MISMATCH";
        case IssueCode::UNIT_MISMATCH:           return "UNIT_MISMATCH";
        case IssueCode::VALUE_REGRESSION:        return "VALUE_REGRESSION";
        case IssueCode::TIME_REGRESSION:         return "TIME_REGRESSION";
        case IssueCode::ID_LEVEL_INVALID:        return "ID_LEVEL_INVALID";
        case IssueCode::PAGINATION_INCONSISTENT: return "PAGINATION_INCONSISTENT";
        case IssueCode::ID_MISMATCH:             return "ID_MISMATCH";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief One compliance finding
 */
struct EichrechtIssue {
    IssueCode code;
    std::string message;
    std::optional<std::string> field;
    IssueSeverity severity = IssueSeverity::ERROR;

    bool isError() const { return severity == IssueSeverity::ERROR; }

    /// @brief "[field] message (CODE)"
    std::string toString() const {
        std::string prefix = field ? "[" + *field + "] " : "";
        return prefix + message + " (" + eichrecht::toString(code) + ")";
    }
};

} // namespace ocmf::eichrecht
