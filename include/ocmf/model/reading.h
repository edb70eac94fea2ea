/**
 * @file reading.h
 * @brief Meter reading (one RD entry)
 */

#pragma once

#include "ocmf/common/error.h"
#include "ocmf/model/enums.h"
#include "ocmf/model/timestamp.h"
#include "ocmf/obis/obis_code.h"
#include <optional>
#include <string>
#include <vector>

namespace ocmf::model {

/**
 * @brief One meter sample
 *
 * Field names follow their meaning; the OCMF key is given for each.
 */
struct Reading {
    Timestamp time;                              ///< TM (required)
    std::optional<ReadingReason> reason;         ///< TX
    std::optional<double> value;                 ///< RV
    std::optional<obis::ObisCode> obis;          ///< RI
    std::optional<Unit> unit;                    ///< RU (required)
    std::optional<CurrentType> currentType;      ///< RT
    std::optional<double> cumulatedLoss;         ///< CL
    std::optional<std::string> errorFlags;       ///< EF ("" is stored as absent)
    MeterStatus status = MeterStatus::OK;        ///< ST (required)

    bool isBegin() const { return reason == ReadingReason::BEGIN; }
    bool isEnd() const { return reason && isEndReading(*reason); }

    bool operator==(const Reading& other) const {
        return time == other.time && reason == other.reason && value == other.value &&
               obis == other.obis && unit == other.unit && currentType == other.currentType &&
               cumulatedLoss == other.cumulatedLoss && errorFlags == other.errorFlags &&
               status == other.status;
    }
    bool operator!=(const Reading& other) const { return !(*this == other); }
};

/**
 * @brief Cross-field checks for a single reading
 *
 * In order:
 *   1. RI and RU form a group (both present or both absent)
 *   2. RU is required
 *   3. CL only with an accumulation register RI (B0-B3, C0-C3)
 *   4. CL must be 0 when TX=B
 *   5. CL must be non-negative
 *   6. EF only contains 'E' and 't'
 *
 * @return std::nullopt if valid, first VALIDATION error otherwise (field
 *         names are unqualified, e.g. "CL")
 */
Status validateReading(const Reading& reading);

/**
 * @brief Transaction state machine over an RD sequence
 *
 * Begin may not follow an end reading, end readings (E, L, R, A, P) need a
 * preceding Begin, and C, X, S, T may not follow an end reading. Readings
 * without TX are skipped. Sequences shorter than two readings are standalone
 * begin/end records and always pass.
 *
 * @return std::nullopt if valid, VALIDATION error on field "RD[i].TX" otherwise
 */
Status validateTransactionSequence(const std::vector<Reading>& readings);

} // namespace ocmf::model
