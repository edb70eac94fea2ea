/**
 * @file payload.h
 * @brief OCMF payload section and its validation pipeline
 */

#pragma once

#include "ocmf/common/error.h"
#include "ocmf/model/enums.h"
#include "ocmf/model/identification.h"
#include "ocmf/model/reading.h"
#include <json/json.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ocmf::model {

/**
 * @brief Cable loss compensation parameters (LC)
 */
struct CableLossCompensation {
    std::optional<std::string> name;   ///< LN, at most 20 characters
    std::optional<int64_t> id;         ///< LI
    double resistance = 0.0;           ///< LR (required)
    Unit unit = Unit::MOHM;            ///< LU (required, mOhm or Ohm)

    bool operator==(const CableLossCompensation& other) const {
        return name == other.name && id == other.id &&
               resistance == other.resistance && unit == other.unit;
    }
};

/**
 * @brief Charge point identification type (CT)
 *
 * Tagged by the known type; vendor-specific values have no tag and are kept
 * as given.
 */
struct ChargePointIdentification {
    std::optional<ChargePointIdentificationType> type;
    std::string text;   ///< Wire value

    static ChargePointIdentification fromString(const std::string& text);

    bool isKnown() const { return type.has_value(); }
    const std::string& toString() const { return text; }

    bool operator==(const ChargePointIdentification& other) const {
        return type == other.type && text == other.text;
    }
    bool operator!=(const ChargePointIdentification& other) const { return !(*this == other); }
};

/**
 * @brief Payload section: session metadata and readings
 */
struct Payload {
    // Gateway
    std::optional<std::string> formatVersion;   ///< FV
    std::optional<std::string> gatewayId;       ///< GI
    std::optional<std::string> gatewaySerial;   ///< GS
    std::optional<std::string> gatewayVersion;  ///< GV

    Pagination pagination;                      ///< PG (required)

    // Meter
    std::optional<std::string> meterVendor;     ///< MV
    std::optional<std::string> meterModel;      ///< MM
    std::optional<std::string> meterSerial;     ///< MS
    std::optional<std::string> meterFirmware;   ///< MF

    // User assignment
    bool identificationStatus = false;                        ///< IS (required)
    std::optional<IdentificationLevel> identificationLevel;   ///< IL
    std::vector<IdentificationFlag> identificationFlags;      ///< IF
    UserIdentification identification;                        ///< IT and ID
    std::optional<std::string> tariffText;                    ///< TT, at most 250 characters

    // Metrologic parameters
    std::optional<std::string> chargeControllerFirmware;      ///< CF, at most 25 characters
    std::optional<CableLossCompensation> lossCompensation;    ///< LC

    // Charge point assignment
    std::optional<ChargePointIdentification> chargePointIdType;  ///< CT
    std::optional<std::string> chargePointId;                 ///< CI

    std::vector<Reading> readings;                            ///< RD (required)

    /// Unknown keys (vendor extensions), kept verbatim
    std::map<std::string, Json::Value> extraFields;

    /// @brief GS if non-empty, else MS
    std::optional<std::string> serialNumber() const;

    /// @brief CT resolved against the known charge point types
    std::optional<ChargePointIdentificationType> chargePointType() const;

    bool operator==(const Payload& other) const;
    bool operator!=(const Payload& other) const { return !(*this == other); }
};

/**
 * @brief Validation policy switches
 */
struct ValidationOptions {
    /// Require MS instead of accepting either GS or MS
    bool requireMeterSerial = false;

    /// @brief Read OCMF_REQUIRE_METER_SERIAL from ConfigManager
    static ValidationOptions fromConfig();
};

/**
 * @brief Run the payload validation pipeline
 *
 * Order (first violation is reported):
 *   1. Length limits and LC parameters
 *   2. Serial number (GS or MS, or MS only with requireMeterSerial)
 *   3. Each reading (validateReading), fields reported as "RD[i].<key>"
 *   4. Identification flag mixing (IF)
 *   5. Identification data format by type (IT/ID)
 *   6. Reading transaction sequence
 *
 * Pagination, timestamps, OBIS codes and enum values are checked when the
 * JSON is mapped onto these types.
 *
 * @return std::nullopt if valid, VALIDATION error otherwise
 */
Status validatePayload(const Payload& payload, const ValidationOptions& options = {});

} // namespace ocmf::model
