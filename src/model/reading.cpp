/**
 * @file reading.cpp
 * @brief Reading validation
 */

#include "ocmf/model/reading.h"
#include "ocmf/utils/string_utils.h"

namespace ocmf::model {

Status validateReading(const Reading& reading) {
    if (reading.obis.has_value() != reading.unit.has_value()) {
        return Error(ErrorKind::VALIDATION, reading.obis ? "RU" : "RI",
                     "RI (Reading Identification) and RU (Reading Unit) must both be present or both absent");
    }

    if (!reading.unit) {
        return Error(ErrorKind::VALIDATION, "RU", "RU (Reading Unit) is required");
    }

    if (reading.cumulatedLoss) {
        double cl = *reading.cumulatedLoss;

        if (!reading.obis || !reading.obis->isAccumulationRegister()) {
            return Error(ErrorKind::VALIDATION, "CL",
                         "CL (Cumulated Loss) can only appear when RI indicates an accumulation register (B0-B3, C0-C3)");
        }
        if (reading.isBegin() && cl != 0.0) {
            return Error(ErrorKind::VALIDATION, "CL",
                         "CL (Cumulated Loss) must be 0 when TX=B (transaction begin), got " +
                         utils::formatDecimal(cl));
        }
        if (cl < 0.0) {
            return Error(ErrorKind::VALIDATION, "CL",
                         "CL (Cumulated Loss) must be non-negative, got " + utils::formatDecimal(cl));
        }
    }

    if (reading.errorFlags &&
        reading.errorFlags->find_first_not_of("Et") != std::string::npos) {
        return Error(ErrorKind::VALIDATION, "EF",
                     "EF (Error Flags) may only contain 'E' and 't', got '" + *reading.errorFlags + "'");
    }

    return std::nullopt;
}

Status validateTransactionSequence(const std::vector<Reading>& readings) {
    if (readings.size() < 2) {
        return std::nullopt;
    }

    enum class State { MID, BEGIN, END };
    State state = State::MID;

    for (size_t i = 0; i < readings.size(); ++i) {
        const auto& reading = readings[i];
        if (!reading.reason) {
            continue;
        }

        const std::string field = "RD[" + std::to_string(i) + "].TX";
        const ReadingReason tx = *reading.reason;

        if (tx == ReadingReason::BEGIN) {
            if (state == State::END) {
                return Error(ErrorKind::VALIDATION, field,
                             "Reading " + std::to_string(i) +
                             ": TX=B (Begin) cannot appear after transaction end");
            }
            state = State::BEGIN;
        } else if (isEndReading(tx)) {
            if (state == State::MID) {
                return Error(ErrorKind::VALIDATION, field,
                             "Reading " + std::to_string(i) + ": TX=" + toString(tx) +
                             " (End) requires TX=B (Begin) first");
            }
            state = State::END;
        } else if (state == State::END) {
            return Error(ErrorKind::VALIDATION, field,
                         "Reading " + std::to_string(i) + ": TX=" + toString(tx) +
                         " cannot appear after transaction end");
        }
    }

    return std::nullopt;
}

} // namespace ocmf::model
