/**
 * @file identification.h
 * @brief User identification (IT, ID, IF) and pagination (PG) types
 */

#pragma once

#include "ocmf/common/error.h"
#include <optional>
#include <string>
#include <vector>

namespace ocmf::model {

// =============================================================================
// Identification type (IT)
// =============================================================================

enum class IdentificationType {
    NONE,
    DENIED,
    UNDEFINED,
    ISO14443,
    ISO15693,
    EMAID,
    EVCCID,
    EVCOID,
    ISO7812,
    CARD_TXN_NR,
    CENTRAL,
    CENTRAL_1,
    CENTRAL_2,
    LOCAL,
    LOCAL_1,
    LOCAL_2,
    PHONE_NUMBER,
    KEY_CODE
};

std::string toString(IdentificationType type);
std::optional<IdentificationType> identificationTypeFromString(const std::string& str);

/// @brief NONE, DENIED and UNDEFINED carry no identification data
bool isNoAssignmentType(IdentificationType type);

/// @brief Types whose ID value has a defined format
bool isFormatRestrictedType(IdentificationType type);

/**
 * @brief Check the ID value against the format required by the IT value
 *
 * - NONE, DENIED, UNDEFINED: ID must be absent or empty
 * - ISO14443: 8 or 14 hex digits
 * - ISO15693: 16 hex digits
 * - EMAID: 14-15 alphanumeric characters
 * - EVCCID: at most 6 characters
 * - EVCOID: DIN 91286, e.g. "NL-TNM-012204-5"
 * - ISO7812: 8-19 digits
 * - PHONE_NUMBER: international number, "+" and 7-15 digits
 * - LOCAL*, CENTRAL*, CARD_TXN_NR, KEY_CODE: any string
 *
 * An absent or empty ID is accepted for every type.
 *
 * @return std::nullopt if valid, VALIDATION error on field "ID" otherwise
 */
Status validateIdentificationData(IdentificationType type, const std::optional<std::string>& id);

/**
 * @brief User identification (IT, ID), tagged by its identification type
 *
 * create() applies validateIdentificationData, so a value obtained from it
 * always satisfies the format its type prescribes. The JSON mapping fills
 * the fields directly and validatePayload checks them in pipeline order.
 */
struct UserIdentification {
    IdentificationType type = IdentificationType::NONE;
    std::optional<std::string> value;

    static Result<UserIdentification> create(IdentificationType type,
                                             std::optional<std::string> value = std::nullopt);

    bool operator==(const UserIdentification& other) const {
        return type == other.type && value == other.value;
    }
    bool operator!=(const UserIdentification& other) const { return !(*this == other); }
};

// =============================================================================
// Identification flags (IF)
// =============================================================================

/// @brief Table an identification flag is drawn from
enum class FlagSource {
    RFID,
    OCPP,
    ISO15118,
    PLMN
};

std::string toString(FlagSource source);

/**
 * @brief One IF entry, tagged with its source table
 *
 * `token` is the full wire value, e.g. "RFID_PLAIN" or "OCPP_AUTH_TLS".
 */
struct IdentificationFlag {
    FlagSource source = FlagSource::RFID;
    std::string token;

    /**
     * @brief Resolve a wire token against the four flag tables
     * @return Flag, or std::nullopt for unknown tokens
     */
    static std::optional<IdentificationFlag> parse(const std::string& token);

    /// @brief "*_NONE" sentinel (no assignment via this method)
    bool isNone() const;

    const std::string& toString() const { return token; }

    bool operator==(const IdentificationFlag& other) const {
        return source == other.source && token == other.token;
    }
    bool operator!=(const IdentificationFlag& other) const { return !(*this == other); }
};

/**
 * @brief Flags from different tables may only be combined if all are *_NONE
 * @return std::nullopt if valid, VALIDATION error on field "IF" otherwise
 */
Status validateIdentificationFlags(const std::vector<IdentificationFlag>& flags);

// =============================================================================
// Pagination (PG)
// =============================================================================

/**
 * @brief Pagination token "T<n>" (transaction) or "F<n>" (fiscal), n >= 1
 *
 * The counter is kept as its decimal digits; the wire format puts no upper
 * bound on it.
 */
struct Pagination {
    char context = 'T';
    std::string number = "1";

    /**
     * @brief Parse "T1", "F42", ... ("T0", "T01" and "F00" are rejected)
     * @return Pagination, or VALIDATION error on field "PG"
     */
    static Result<Pagination> parse(const std::string& text);

    bool isTransaction() const { return context == 'T'; }
    bool isFiscal() const { return context == 'F'; }

    /// @brief Same context, counter incremented by one
    Pagination next() const;

    /// @brief True if @p other carries the counter directly after this one
    bool isFollowedBy(const Pagination& other) const { return next().number == other.number; }

    std::string toString() const { return std::string(1, context) + number; }

    bool operator==(const Pagination& other) const {
        return context == other.context && number == other.number;
    }
    bool operator!=(const Pagination& other) const { return !(*this == other); }
};

} // namespace ocmf::model
