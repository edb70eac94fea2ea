/**
 * @file enums.h
 * @brief OCMF enumerations and their wire representations
 *
 * Each enum has a toString() returning the exact wire token and a
 * <name>FromString() returning std::nullopt for unknown tokens.
 */

#pragma once

#include <optional>
#include <string>

namespace ocmf::model {

// =============================================================================
// Reading reason (TX)
// =============================================================================

enum class ReadingReason {
    BEGIN,                      // B
    CHARGING,                   // C
    EXCEPTION,                  // X
    END,                        // E
    TERMINATION_LOCAL,          // L
    TERMINATION_REMOTE,         // R
    TERMINATION_ABORT,          // A
    TERMINATION_POWER_FAILURE,  // P
    SUSPENDED,                  // S
    TARIFF_CHANGE               // T
};

inline std::string toString(ReadingReason reason) {
    switch (reason) {
        case ReadingReason::BEGIN:                     return "B";
        case ReadingReason::CHARGING:                  return "C";
        case ReadingReason::EXCEPTION:                 return "X";
        case ReadingReason::END:                       return "E";
        case ReadingReason::TERMINATION_LOCAL:         return "L";
        case ReadingReason::TERMINATION_REMOTE:        return "R";
        case ReadingReason::TERMINATION_ABORT:         return "A";
        case ReadingReason::TERMINATION_POWER_FAILURE: return "P";
        case ReadingReason::SUSPENDED:                 return "S";
        case ReadingReason::TARIFF_CHANGE:             return "T";
    }
    return "";
}

inline std::optional<ReadingReason> readingReasonFromString(const std::string& str) {
    if (str == "B") return ReadingReason::BEGIN;
    if (str == "C") return ReadingReason::CHARGING;
    if (str == "X") return ReadingReason::EXCEPTION;
    if (str == "E") return ReadingReason::END;
    if (str == "L") return ReadingReason::TERMINATION_LOCAL;
    if (str == "R") return ReadingReason::TERMINATION_REMOTE;
    if (str == "A") return ReadingReason::TERMINATION_ABORT;
    if (str == "P") return ReadingReason::TERMINATION_POWER_FAILURE;
    if (str == "S") return ReadingReason::SUSPENDED;
    if (str == "T") return ReadingReason::TARIFF_CHANGE;
    return std::nullopt;
}

/// @brief E, L, R, A and P close a transaction
inline bool isEndReading(ReadingReason reason) {
    switch (reason) {
        case ReadingReason::END:
        case ReadingReason::TERMINATION_LOCAL:
        case ReadingReason::TERMINATION_REMOTE:
        case ReadingReason::TERMINATION_ABORT:
        case ReadingReason::TERMINATION_POWER_FAILURE:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Meter status (ST)
// =============================================================================

enum class MeterStatus {
    NOT_PRESENT,   // N
    OK,            // G
    TIMEOUT,       // T
    DISCONNECTED,  // D
    NOT_FOUND,     // R
    MANIPULATED,   // M
    EXCHANGED,     // X
    INCOMPATIBLE,  // I
    OUT_OF_RANGE,  // O
    SUBSTITUTE,    // S
    OTHER_ERROR,   // E
    READ_ERROR     // F
};

inline std::string toString(MeterStatus status) {
    switch (status) {
        case MeterStatus::NOT_PRESENT:  return "N";
        case MeterStatus::OK:           return "G";
        case MeterStatus::TIMEOUT:      return "T";
        case MeterStatus::DISCONNECTED: return "D";
        case MeterStatus::NOT_FOUND:    return "R";
        case MeterStatus::MANIPULATED:  return "M";
        case MeterStatus::EXCHANGED:    return "X";
        case MeterStatus::INCOMPATIBLE: return "I";
        case MeterStatus::OUT_OF_RANGE: return "O";
        case MeterStatus::SUBSTITUTE:   return "S";
        case MeterStatus::OTHER_ERROR:  return "E";
        case MeterStatus::READ_ERROR:   return "F";
    }
    return "";
}

inline std::optional<MeterStatus> meterStatusFromString(const std::string& str) {
    if (str == "N") return MeterStatus::NOT_PRESENT;
    if (str == "G") return MeterStatus::OK;
    if (str == "T") return MeterStatus::TIMEOUT;
    if (str == "D") return MeterStatus::DISCONNECTED;
    if (str == "R") return MeterStatus::NOT_FOUND;
    if (str == "M") return MeterStatus::MANIPULATED;
    if (str == "X") return MeterStatus::EXCHANGED;
    if (str == "I") return MeterStatus::INCOMPATIBLE;
    if (str == "O") return MeterStatus::OUT_OF_RANGE;
    if (str == "S") return MeterStatus::SUBSTITUTE;
    if (str == "E") return MeterStatus::OTHER_ERROR;
    if (str == "F") return MeterStatus::READ_ERROR;
    return std::nullopt;
}

// =============================================================================
// Time synchronization status (last character of TM)
// =============================================================================

enum class TimeStatus {
    UNKNOWN_OR_UNSYNCHRONIZED,  // U
    INFORMATIVE,                // I
    SYNCHRONIZED,               // S
    RELATIVE                    // R
};

inline char toChar(TimeStatus status) {
    switch (status) {
        case TimeStatus::UNKNOWN_OR_UNSYNCHRONIZED: return 'U';
        case TimeStatus::INFORMATIVE:               return 'I';
        case TimeStatus::SYNCHRONIZED:              return 'S';
        case TimeStatus::RELATIVE:                  return 'R';
    }
    return 'U';
}

inline std::string toString(TimeStatus status) {
    return std::string(1, toChar(status));
}

inline std::optional<TimeStatus> timeStatusFromChar(char c) {
    switch (c) {
        case 'U': return TimeStatus::UNKNOWN_OR_UNSYNCHRONIZED;
        case 'I': return TimeStatus::INFORMATIVE;
        case 'S': return TimeStatus::SYNCHRONIZED;
        case 'R': return TimeStatus::RELATIVE;
        default:  return std::nullopt;
    }
}

// =============================================================================
// Reading current type (RT)
// =============================================================================

enum class CurrentType {
    AC,
    DC
};

inline std::string toString(CurrentType type) {
    return type == CurrentType::AC ? "AC" : "DC";
}

inline std::optional<CurrentType> currentTypeFromString(const std::string& str) {
    if (str == "AC") return CurrentType::AC;
    if (str == "DC") return CurrentType::DC;
    return std::nullopt;
}

// =============================================================================
// Units (RU, LU)
// =============================================================================

enum class Unit {
    KWH,   // kWh
    WH,    // Wh
    MOHM,  // mOhm
    OHM,   // Ohm
    SEC,   // sec
    MIN,   // min
    H      // h
};

inline std::string toString(Unit unit) {
    switch (unit) {
        case Unit::KWH:  return "kWh";
        case Unit::WH:   return "Wh";
        case Unit::MOHM: return "mOhm";
        case Unit::OHM:  return "Ohm";
        case Unit::SEC:  return "sec";
        case Unit::MIN:  return "min";
        case Unit::H:    return "h";
    }
    return "";
}

inline std::optional<Unit> unitFromString(const std::string& str) {
    if (str == "kWh") return Unit::KWH;
    if (str == "Wh") return Unit::WH;
    if (str == "mOhm") return Unit::MOHM;
    if (str == "Ohm") return Unit::OHM;
    if (str == "sec") return Unit::SEC;
    if (str == "min") return Unit::MIN;
    if (str == "h") return Unit::H;
    return std::nullopt;
}

inline bool isResistanceUnit(Unit unit) {
    return unit == Unit::MOHM || unit == Unit::OHM;
}

// =============================================================================
// Identification level (IL)
// =============================================================================

enum class IdentificationLevel {
    NONE,
    HEARSAY,
    TRUSTED,
    VERIFIED,
    CERTIFIED,
    SECURE,
    MISMATCH,   // UID mismatch
    INVALID,    // certificate incorrect
    OUTDATED,   // certificate expired
    UNKNOWN     // certificate not verifiable
};

inline std::string toString(IdentificationLevel level) {
    switch (level) {
        case IdentificationLevel::NONE:      return "NONE";
        case IdentificationLevel::HEARSAY:   return "HEARSAY";
        case IdentificationLevel::TRUSTED:   return "TRUSTED";
        case IdentificationLevel::VERIFIED:  return "VERIFIED";
        case IdentificationLevel::CERTIFIED: return "CERTIFIED";
        case IdentificationLevel::SECURE:    return "SECURE";
        case IdentificationLevel::MISMATCH:  return "MISMATCH";
        case IdentificationLevel::INVALID:   return "INVALID";
        case IdentificationLevel::OUTDATED:  return "OUTDATED";
        case IdentificationLevel::UNKNOWN:   return "UNKNOWN";
    }
    return "";
}

inline std::optional<IdentificationLevel> identificationLevelFromString(const std::string& str) {
    if (str == "NONE") return IdentificationLevel::NONE;
    if (str == "HEARSAY") return IdentificationLevel::HEARSAY;
    if (str == "TRUSTED") return IdentificationLevel::TRUSTED;
    if (str == "VERIFIED") return IdentificationLevel::VERIFIED;
    if (str == "CERTIFIED") return IdentificationLevel::CERTIFIED;
    if (str == "SECURE") return IdentificationLevel::SECURE;
    if (str == "MISMATCH") return IdentificationLevel::MISMATCH;
    if (str == "INVALID") return IdentificationLevel::INVALID;
    if (str == "OUTDATED") return IdentificationLevel::OUTDATED;
    if (str == "UNKNOWN") return IdentificationLevel::UNKNOWN;
    return std::nullopt;
}

/// @brief Levels reporting a failed identification
inline bool isErrorState(IdentificationLevel level) {
    return level == IdentificationLevel::MISMATCH ||
           level == IdentificationLevel::INVALID ||
           level == IdentificationLevel::OUTDATED ||
           level == IdentificationLevel::UNKNOWN;
}

// =============================================================================
// Charge point identification type (CT)
// =============================================================================

enum class ChargePointIdentificationType {
    EVSEID,
    CBIDC
};

inline std::string toString(ChargePointIdentificationType type) {
    return type == ChargePointIdentificationType::EVSEID ? "EVSEID" : "CBIDC";
}

inline std::optional<ChargePointIdentificationType> chargePointTypeFromString(const std::string& str) {
    if (str == "EVSEID") return ChargePointIdentificationType::EVSEID;
    if (str == "CBIDC") return ChargePointIdentificationType::CBIDC;
    return std::nullopt;
}

} // namespace ocmf::model
