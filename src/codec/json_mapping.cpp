/**
 * @file json_mapping.cpp
 * @brief jsoncpp <-> OCMF model mapping
 */

#include "ocmf/codec/json_mapping.h"
#include "ocmf/utils/string_utils.h"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <set>
#include <sstream>
#include <utility>

namespace ocmf::codec {

namespace {

const char* const kInheritableReadingFields[] = {"TM", "TX", "RI", "RU", "RT", "EF", "ST"};

const std::set<std::string>& knownPayloadKeys() {
    static const std::set<std::string> keys = {
        "FV", "GI", "GS", "GV", "PG", "MV", "MM", "MS", "MF",
        "IS", "IL", "IF", "IT", "ID", "TT", "CF", "LC", "CT", "CI", "RD"
    };
    return keys;
}

bool isJsonInteger(const Json::Value& v) {
    return v.type() == Json::intValue || v.type() == Json::uintValue;
}

/**
 * @brief Typed field access on one JSON object; records the first failure
 *
 * Once a check has failed every further accessor returns an empty value,
 * so callers can read all fields and test failed() once.
 */
class FieldReader {
public:
    FieldReader(const Json::Value& object, std::string prefix = "")
        : object_(object), prefix_(std::move(prefix)) {}

    bool failed() const { return error_.has_value(); }
    const Error& error() const { return *error_; }

    void fail(const std::string& key, const std::string& message) {
        if (!error_) {
            error_ = Error(ErrorKind::VALIDATION, prefix_ + key, message);
        }
    }

    void fail(const Error& inner) {
        if (!error_) {
            error_ = inner;
            error_->field = prefix_ + inner.field;
        }
    }

    /// Present and not null
    bool has(const char* key) const {
        return object_.isMember(key) && !object_[key].isNull();
    }

    bool require(const char* key) {
        if (failed()) return false;
        if (!has(key)) {
            fail(key, std::string(key) + " is required");
            return false;
        }
        return true;
    }

    std::optional<std::string> optString(const char* key) {
        if (failed() || !has(key)) return std::nullopt;
        const Json::Value& v = object_[key];
        if (!v.isString()) {
            fail(key, std::string(key) + " must be a string");
            return std::nullopt;
        }
        return v.asString();
    }

    std::optional<std::string> requireString(const char* key) {
        if (!require(key)) return std::nullopt;
        return optString(key);
    }

    std::optional<bool> requireBool(const char* key) {
        if (!require(key)) return std::nullopt;
        const Json::Value& v = object_[key];
        if (!v.isBool()) {
            fail(key, std::string(key) + " must be a boolean");
            return std::nullopt;
        }
        return v.asBool();
    }

    /// Decimal given as JSON number or numeric string
    std::optional<double> optDecimal(const char* key) {
        if (failed() || !has(key)) return std::nullopt;
        const Json::Value& v = object_[key];
        if (v.isNumeric() && !v.isBool()) {
            return v.asDouble();
        }
        if (v.isString()) {
            const std::string text = v.asString();
            char* end = nullptr;
            errno = 0;
            double parsed = std::strtod(text.c_str(), &end);
            if (!text.empty() && end == text.c_str() + text.size() && errno == 0 &&
                std::isfinite(parsed)) {
                return parsed;
            }
        }
        fail(key, std::string(key) + " must be a decimal number");
        return std::nullopt;
    }

    std::optional<int64_t> optInteger(const char* key) {
        if (failed() || !has(key)) return std::nullopt;
        const Json::Value& v = object_[key];
        if (!isJsonInteger(v) || !v.isInt64()) {
            fail(key, std::string(key) + " must be an integer");
            return std::nullopt;
        }
        return v.asInt64();
    }

    /// String token resolved through an enum parser
    template <typename E, typename Parser>
    std::optional<E> optEnum(const char* key, Parser parse) {
        auto text = optString(key);
        if (!text) return std::nullopt;
        auto value = parse(*text);
        if (!value) {
            fail(key, std::string(key) + " has unknown value '" + *text + "'");
        }
        return value;
    }

    const Json::Value& get(const char* key) const { return object_[key]; }

private:
    const Json::Value& object_;
    std::string prefix_;
    std::optional<Error> error_;
};

std::optional<std::string> readFormatVersion(FieldReader& r) {
    if (r.failed() || !r.has("FV")) return std::nullopt;
    const Json::Value& v = r.get("FV");
    if (isJsonInteger(v)) {
        return std::to_string(v.asLargestInt());
    }
    if (v.isDouble()) {
        return utils::formatDecimal(v.asDouble());
    }
    return r.optString("FV");
}

std::optional<model::ChargePointIdentification> readChargePointType(FieldReader& r) {
    if (r.failed() || !r.has("CT")) return std::nullopt;
    const Json::Value& v = r.get("CT");
    if (isJsonInteger(v)) {
        if (v.asLargestInt() == 0) return std::nullopt;
        return model::ChargePointIdentification::fromString(std::to_string(v.asLargestInt()));
    }
    auto ct = r.optString("CT");
    if (!ct || ct->empty()) return std::nullopt;
    return model::ChargePointIdentification::fromString(*ct);
}

// The IT/ID format pairing is a cross-field rule checked by validatePayload
model::UserIdentification readUserIdentification(FieldReader& r) {
    model::UserIdentification identification;
    identification.type = r.optEnum<model::IdentificationType>(
        "IT", model::identificationTypeFromString).value_or(model::IdentificationType::NONE);
    identification.value = r.optString("ID");
    return identification;
}

std::optional<model::CableLossCompensation> readLossCompensation(FieldReader& r) {
    if (r.failed() || !r.has("LC")) return std::nullopt;
    const Json::Value& v = r.get("LC");
    if (!v.isObject()) {
        r.fail("LC", "LC must be an object");
        return std::nullopt;
    }

    FieldReader lc(v, "LC.");
    model::CableLossCompensation result;
    result.name = lc.optString("LN");
    result.id = lc.optInteger("LI");
    if (lc.require("LR")) {
        result.resistance = lc.optDecimal("LR").value_or(0.0);
    }
    if (lc.require("LU")) {
        auto unit = lc.optEnum<model::Unit>("LU", model::unitFromString);
        if (unit) result.unit = *unit;
    }

    if (lc.failed()) {
        r.fail(lc.error());
        return std::nullopt;
    }
    return result;
}

std::vector<model::IdentificationFlag> readIdentificationFlags(FieldReader& r) {
    std::vector<model::IdentificationFlag> flags;
    if (r.failed() || !r.has("IF")) return flags;

    const Json::Value& v = r.get("IF");
    if (!v.isArray()) {
        r.fail("IF", "IF must be an array");
        return flags;
    }

    for (Json::ArrayIndex i = 0; i < v.size(); ++i) {
        const std::string field = "IF[" + std::to_string(i) + "]";
        if (!v[i].isString()) {
            r.fail(field, field + " must be a string");
            return flags;
        }
        auto flag = model::IdentificationFlag::parse(v[i].asString());
        if (!flag) {
            r.fail(field, "Unknown identification flag '" + v[i].asString() + "'");
            return flags;
        }
        flags.push_back(*flag);
    }
    return flags;
}

Result<model::Reading> readingFromJson(const Json::Value& object, size_t index) {
    const std::string prefix = "RD[" + std::to_string(index) + "].";
    if (!object.isObject()) {
        return Error(ErrorKind::VALIDATION, "RD[" + std::to_string(index) + "]",
                     "Reading must be an object");
    }

    FieldReader r(object, prefix);
    model::Reading reading;

    if (auto tm = r.requireString("TM")) {
        auto ts = model::Timestamp::parse(*tm);
        if (ts) {
            reading.time = ts.value();
        } else {
            r.fail(ts.error());
        }
    }

    reading.reason = r.optEnum<model::ReadingReason>("TX", model::readingReasonFromString);
    reading.value = r.optDecimal("RV");

    if (auto ri = r.optString("RI")) {
        auto code = obis::ObisCode::parse(*ri);
        if (code) {
            reading.obis = code.value();
        } else {
            r.fail(code.error());
        }
    }

    reading.unit = r.optEnum<model::Unit>("RU", model::unitFromString);
    reading.currentType = r.optEnum<model::CurrentType>("RT", model::currentTypeFromString);
    reading.cumulatedLoss = r.optDecimal("CL");

    auto ef = r.optString("EF");
    if (ef && !ef->empty()) {
        reading.errorFlags = ef;
    }

    if (r.require("ST")) {
        auto st = r.optEnum<model::MeterStatus>("ST", model::meterStatusFromString);
        if (st) reading.status = *st;
    }

    if (r.failed()) {
        return r.error();
    }
    return reading;
}

} // namespace

Result<Json::Value> parseJsonObject(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["strictRoot"] = true;
    builder["failIfExtra"] = true;
    builder["rejectDupKeys"] = true;

    Json::Value root;
    std::string errs;
    std::istringstream iss(text);

    if (!Json::parseFromStream(builder, iss, &root, &errs)) {
        return Error(ErrorKind::FORMAT, "", "Invalid JSON: " + utils::trim(errs));
    }
    if (!root.isObject()) {
        return Error(ErrorKind::FORMAT, "", "JSON value must be an object");
    }
    return root;
}

std::string writeCompactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    // 17 significant digits read back as the same double
    builder["precision"] = 17;
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

Json::Value applyReadingInheritance(const Json::Value& readings) {
    Json::Value result(Json::arrayValue);
    Json::Value last(Json::objectValue);

    for (const auto& entry : readings) {
        if (!entry.isObject()) {
            result.append(entry);
            continue;
        }

        Json::Value reading = entry;
        for (const char* field : kInheritableReadingFields) {
            if (reading.isMember(field)) {
                last[field] = reading[field];
            } else if (last.isMember(field)) {
                reading[field] = last[field];
            }
        }
        result.append(reading);
    }
    return result;
}

Result<model::Payload> payloadFromJson(const Json::Value& root) {
    if (!root.isObject()) {
        return Error(ErrorKind::VALIDATION, "", "Payload must be a JSON object");
    }

    FieldReader r(root);
    model::Payload payload;

    payload.formatVersion = readFormatVersion(r);
    payload.gatewayId = r.optString("GI");
    payload.gatewaySerial = r.optString("GS");
    payload.gatewayVersion = r.optString("GV");

    if (auto pg = r.requireString("PG")) {
        auto pagination = model::Pagination::parse(*pg);
        if (pagination) {
            payload.pagination = pagination.value();
        } else {
            r.fail(pagination.error());
        }
    }

    payload.meterVendor = r.optString("MV");
    payload.meterModel = r.optString("MM");
    payload.meterSerial = r.optString("MS");
    payload.meterFirmware = r.optString("MF");

    if (auto is = r.requireBool("IS")) {
        payload.identificationStatus = *is;
    }
    payload.identificationLevel = r.optEnum<model::IdentificationLevel>(
        "IL", model::identificationLevelFromString);
    payload.identificationFlags = readIdentificationFlags(r);
    payload.identification = readUserIdentification(r);
    payload.tariffText = r.optString("TT");

    payload.chargeControllerFirmware = r.optString("CF");
    payload.lossCompensation = readLossCompensation(r);

    payload.chargePointIdType = readChargePointType(r);
    payload.chargePointId = r.optString("CI");

    if (r.require("RD")) {
        const Json::Value& rd = r.get("RD");
        if (!rd.isArray()) {
            r.fail("RD", "RD must be an array");
        } else {
            Json::Value readings = applyReadingInheritance(rd);
            for (Json::ArrayIndex i = 0; i < readings.size() && !r.failed(); ++i) {
                auto reading = readingFromJson(readings[i], i);
                if (reading) {
                    payload.readings.push_back(std::move(reading).value());
                } else {
                    r.fail(reading.error());
                }
            }
        }
    }

    if (r.failed()) {
        return r.error();
    }

    for (const auto& key : root.getMemberNames()) {
        if (knownPayloadKeys().count(key) == 0) {
            payload.extraFields[key] = root[key];
        }
    }

    return payload;
}

Result<model::Signature> signatureFromJson(const Json::Value& root) {
    if (!root.isObject()) {
        return Error(ErrorKind::VALIDATION, "", "Signature must be a JSON object");
    }

    FieldReader r(root);
    model::Signature signature;

    signature.algorithm = r.optString("SA");
    signature.encoding = r.optEnum<model::SignatureEncoding>("SE", model::signatureEncodingFromString);
    signature.mimeType = r.optString("SM");
    if (auto sd = r.requireString("SD")) {
        signature.data = *sd;
    }
    signature.publicKey = r.optString("PK");

    if (r.failed()) {
        return r.error();
    }
    return signature;
}

Json::Value readingToJson(const model::Reading& reading) {
    Json::Value json(Json::objectValue);

    json["TM"] = reading.time.toString();
    if (reading.reason) json["TX"] = model::toString(*reading.reason);
    if (reading.value) json["RV"] = *reading.value;
    if (reading.obis) json["RI"] = reading.obis->toString();
    if (reading.unit) json["RU"] = model::toString(*reading.unit);
    if (reading.currentType) json["RT"] = model::toString(*reading.currentType);
    if (reading.cumulatedLoss) json["CL"] = *reading.cumulatedLoss;
    if (reading.errorFlags) json["EF"] = *reading.errorFlags;
    json["ST"] = model::toString(reading.status);

    return json;
}

Json::Value payloadToJson(const model::Payload& payload) {
    Json::Value json(Json::objectValue);

    auto put = [&json](const char* key, const std::optional<std::string>& value) {
        if (value) json[key] = *value;
    };

    put("FV", payload.formatVersion);
    put("GI", payload.gatewayId);
    put("GS", payload.gatewaySerial);
    put("GV", payload.gatewayVersion);
    json["PG"] = payload.pagination.toString();
    put("MV", payload.meterVendor);
    put("MM", payload.meterModel);
    put("MS", payload.meterSerial);
    put("MF", payload.meterFirmware);

    json["IS"] = payload.identificationStatus;
    if (payload.identificationLevel) {
        json["IL"] = model::toString(*payload.identificationLevel);
    }
    if (!payload.identificationFlags.empty()) {
        Json::Value flags(Json::arrayValue);
        for (const auto& flag : payload.identificationFlags) {
            flags.append(flag.toString());
        }
        json["IF"] = flags;
    }
    json["IT"] = model::toString(payload.identification.type);
    put("ID", payload.identification.value);
    put("TT", payload.tariffText);

    put("CF", payload.chargeControllerFirmware);
    if (payload.lossCompensation) {
        const auto& lc = *payload.lossCompensation;
        Json::Value lcJson(Json::objectValue);
        if (lc.name) lcJson["LN"] = *lc.name;
        if (lc.id) lcJson["LI"] = static_cast<Json::Int64>(*lc.id);
        lcJson["LR"] = lc.resistance;
        lcJson["LU"] = model::toString(lc.unit);
        json["LC"] = lcJson;
    }

    if (payload.chargePointIdType) {
        json["CT"] = payload.chargePointIdType->toString();
    }
    put("CI", payload.chargePointId);

    Json::Value readings(Json::arrayValue);
    for (const auto& reading : payload.readings) {
        readings.append(readingToJson(reading));
    }
    json["RD"] = readings;

    for (const auto& [key, value] : payload.extraFields) {
        json[key] = value;
    }

    return json;
}

Json::Value signatureToJson(const model::Signature& signature) {
    Json::Value json(Json::objectValue);

    if (signature.algorithm) json["SA"] = *signature.algorithm;
    if (signature.encoding) json["SE"] = model::toString(*signature.encoding);
    if (signature.mimeType) json["SM"] = *signature.mimeType;
    json["SD"] = signature.data;
    if (signature.publicKey) json["PK"] = *signature.publicKey;

    return json;
}

} // namespace ocmf::codec
