/**
 * @file payload.cpp
 * @brief Payload validation pipeline
 */

#include "ocmf/model/payload.h"
#include "ocmf/common/config_manager.h"

namespace ocmf::model {

namespace {

bool isPresent(const std::optional<std::string>& value) {
    return value && !value->empty();
}

Status checkLength(const std::optional<std::string>& value, const std::string& field, size_t maxLength) {
    if (value && value->size() > maxLength) {
        return Error(ErrorKind::VALIDATION, field,
                     field + " exceeds maximum length of " + std::to_string(maxLength) +
                     " characters (got " + std::to_string(value->size()) + ")");
    }
    return std::nullopt;
}

Status validateLimits(const Payload& payload) {
    if (auto err = checkLength(payload.tariffText, "TT", 250)) return err;
    if (auto err = checkLength(payload.chargeControllerFirmware, "CF", 25)) return err;

    if (payload.lossCompensation) {
        const auto& lc = *payload.lossCompensation;
        if (auto err = checkLength(lc.name, "LC.LN", 20)) return err;
        if (!isResistanceUnit(lc.unit)) {
            return Error(ErrorKind::VALIDATION, "LC.LU",
                         "LC.LU must be a resistance unit (mOhm or Ohm), got '" + toString(lc.unit) + "'");
        }
    }
    return std::nullopt;
}

Status validateSerialNumbers(const Payload& payload, const ValidationOptions& options) {
    if (options.requireMeterSerial) {
        if (!isPresent(payload.meterSerial)) {
            return Error(ErrorKind::VALIDATION, "MS", "Meter Serial (MS) must be provided");
        }
        return std::nullopt;
    }

    if (!isPresent(payload.gatewaySerial) && !isPresent(payload.meterSerial)) {
        return Error(ErrorKind::VALIDATION, "GS/MS",
                     "Either Gateway Serial (GS) or Meter Serial (MS) must be provided");
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> Payload::serialNumber() const {
    if (isPresent(gatewaySerial)) return gatewaySerial;
    if (isPresent(meterSerial)) return meterSerial;
    return std::nullopt;
}

ChargePointIdentification ChargePointIdentification::fromString(const std::string& text) {
    return ChargePointIdentification{chargePointTypeFromString(text), text};
}

std::optional<ChargePointIdentificationType> Payload::chargePointType() const {
    if (!chargePointIdType) {
        return std::nullopt;
    }
    return chargePointIdType->type;
}

bool Payload::operator==(const Payload& other) const {
    return formatVersion == other.formatVersion &&
           gatewayId == other.gatewayId &&
           gatewaySerial == other.gatewaySerial &&
           gatewayVersion == other.gatewayVersion &&
           pagination == other.pagination &&
           meterVendor == other.meterVendor &&
           meterModel == other.meterModel &&
           meterSerial == other.meterSerial &&
           meterFirmware == other.meterFirmware &&
           identificationStatus == other.identificationStatus &&
           identificationLevel == other.identificationLevel &&
           identificationFlags == other.identificationFlags &&
           identification == other.identification &&
           tariffText == other.tariffText &&
           chargeControllerFirmware == other.chargeControllerFirmware &&
           lossCompensation == other.lossCompensation &&
           chargePointIdType == other.chargePointIdType &&
           chargePointId == other.chargePointId &&
           readings == other.readings &&
           extraFields == other.extraFields;
}

ValidationOptions ValidationOptions::fromConfig() {
    ValidationOptions options;
    options.requireMeterSerial = common::ConfigManager::getInstance().getBool(
        common::ConfigManager::REQUIRE_METER_SERIAL, false);
    return options;
}

Status validatePayload(const Payload& payload, const ValidationOptions& options) {
    if (auto err = validateLimits(payload)) return err;
    if (auto err = validateSerialNumbers(payload, options)) return err;

    for (size_t i = 0; i < payload.readings.size(); ++i) {
        if (auto err = validateReading(payload.readings[i])) {
            err->field = "RD[" + std::to_string(i) + "]." + err->field;
            return err;
        }
    }

    if (auto err = validateIdentificationFlags(payload.identificationFlags)) return err;
    if (auto err = validateIdentificationData(payload.identification.type, payload.identification.value)) return err;
    if (auto err = validateTransactionSequence(payload.readings)) return err;

    return std::nullopt;
}

} // namespace ocmf::model
