/**
 * @file timestamp.h
 * @brief OCMF timestamp with synchronization status
 *
 * Wire form: "2019-08-13T10:03:15,000+0000 I" (comma before milliseconds,
 * numeric UTC offset without colon, one status character).
 */

#pragma once

#include "ocmf/common/error.h"
#include "ocmf/model/enums.h"
#include <cstdint>
#include <string>

namespace ocmf::model {

/**
 * @brief Parsed TM value
 *
 * Keeps the local date/time fields and the UTC offset as written, so that
 * toString() reproduces the wire text exactly.
 */
struct Timestamp {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;
    int utcOffsetMinutes = 0;  ///< e.g. +0200 -> 120
    TimeStatus status = TimeStatus::UNKNOWN_OR_UNSYNCHRONIZED;

    /**
     * @brief Parse the OCMF timestamp text
     * @return Timestamp, or VALIDATION error on field "TM"
     */
    static Result<Timestamp> parse(const std::string& text);

    /// @brief Wire representation
    std::string toString() const;

    /// @brief Milliseconds since 1970-01-01T00:00:00Z
    int64_t epochMillis() const;

    /// @brief Instant ordering (-1, 0, 1), ignoring status and offset notation
    int compareInstant(const Timestamp& other) const;

    bool isSynchronized() const { return status == TimeStatus::SYNCHRONIZED; }

    bool operator==(const Timestamp& other) const;
    bool operator!=(const Timestamp& other) const { return !(*this == other); }
};

} // namespace ocmf::model
