/**
 * @file test_payload_validation.cpp
 * @brief Unit tests for payload mapping and the validation pipeline
 */

#include <gtest/gtest.h>
#include "ocmf/codec/json_mapping.h"
#include "ocmf/model/payload.h"
#include "test_helpers.h"

using namespace ocmf;
using namespace ocmf::model;
using namespace ocmf::test;

class PayloadValidationTest : public ::testing::Test {
protected:
    static Result<Payload> map(const std::string& json) {
        auto root = codec::parseJsonObject(json);
        if (!root) {
            return root.error();
        }
        return codec::payloadFromJson(root.value());
    }

    static Payload mapOk(const std::string& json) {
        auto payload = map(json);
        EXPECT_TRUE(payload) << (payload ? "" : payload.error().toString());
        return payload ? payload.value() : Payload{};
    }

    /// Map and validate; returns the first error, if any
    static std::optional<Error> check(const std::string& json, const ValidationOptions& options = {}) {
        auto payload = map(json);
        if (!payload) {
            return payload.error();
        }
        return validatePayload(payload.value(), options);
    }

    static std::string beginEnd() {
        return readingJson("2023-01-01T12:00:00,000+0000 S", "B", "10.0") + "," +
               readingJson("2023-01-01T13:00:00,000+0000 S", "E", "20.0");
    }
};

TEST_F(PayloadValidationTest, Valid) {
    EXPECT_FALSE(check(payloadJson()));
    EXPECT_FALSE(check(payloadJson(beginEnd())));
}

TEST_F(PayloadValidationTest, KebaPayload) {
    auto payload = mapOk(KEBA_PAYLOAD);
    EXPECT_FALSE(validatePayload(payload));
    EXPECT_EQ(payload.pagination.toString(), "T32");
    EXPECT_EQ(payload.identificationFlags.size(), 4u);
    EXPECT_EQ(payload.identification.type, IdentificationType::NONE);
    ASSERT_EQ(payload.readings.size(), 2u);
    EXPECT_DOUBLE_EQ(*payload.readings[0].value, 0.2596);
    EXPECT_FALSE(payload.readings[0].errorFlags.has_value());
    EXPECT_EQ(payload.serialNumber(), std::optional<std::string>("17619300"));
}

// =============================================================================
// Mapping
// =============================================================================

TEST_F(PayloadValidationTest, Mapping_RequiredFields) {
    auto err = check(R"({"FV":"1.0","IS":false,"RD":[]})");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "PG");
    EXPECT_EQ(err->message, "PG is required");

    err = check(R"({"PG":"T1","RD":[]})");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "IS");

    err = check(R"({"PG":"T1","IS":false,"GS":"1"})");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "RD");
}

TEST_F(PayloadValidationTest, Mapping_WrongTypes) {
    auto err = check(payloadJson(readingJson(), "T1", R"("MS":42)"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "MS");

    err = check(R"({"PG":"T1","IS":"false","GS":"1","RD":[]})");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "IS");
}

TEST_F(PayloadValidationTest, Mapping_NumericFormatVersion) {
    auto payload = mapOk(R"({"FV":1.0,"PG":"T1","IS":false,"GS":"1","RD":[]})");
    EXPECT_EQ(payload.formatVersion, std::optional<std::string>("1.0"));
}

TEST_F(PayloadValidationTest, Mapping_UnknownEnumValue) {
    auto err = check(payloadJson(readingJson(), "T1", R"("IT":"MAYBE")"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "IT");

    err = check(payloadJson(readingJson("2023-01-01T12:00:00,000+0000 S", "Q")));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "RD[0].TX");
}

TEST_F(PayloadValidationTest, Mapping_InvalidTimestampInReading) {
    auto err = check(payloadJson(readingJson("2023-01-01 12:00:00")));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "RD[0].TM");
}

TEST_F(PayloadValidationTest, Mapping_ReadingInheritance) {
    auto payload = mapOk(payloadJson(
        readingJson() + R"(,{"RV":60.0})" + R"(,{"RV":70.0,"TX":"E","TM":"2023-01-01T13:00:00,000+0000 S"})"));
    ASSERT_EQ(payload.readings.size(), 3u);

    const auto& inherited = payload.readings[1];
    EXPECT_EQ(inherited.time, payload.readings[0].time);
    EXPECT_EQ(inherited.reason, ReadingReason::BEGIN);
    EXPECT_EQ(inherited.unit, Unit::KWH);
    EXPECT_EQ(inherited.obis->toString(), "01-00:B2.08.00*FF");
    EXPECT_EQ(inherited.status, MeterStatus::OK);
    EXPECT_DOUBLE_EQ(*inherited.value, 60.0);

    EXPECT_EQ(payload.readings[2].reason, ReadingReason::END);
    EXPECT_EQ(payload.readings[2].unit, Unit::KWH);
}

TEST_F(PayloadValidationTest, Mapping_InheritanceDoesNotCopyValueOrLoss) {
    auto payload = mapOk(payloadJson(readingJson() + R"(,{"TX":"E"})"));
    ASSERT_EQ(payload.readings.size(), 2u);
    EXPECT_FALSE(payload.readings[1].value.has_value());
    EXPECT_FALSE(payload.readings[1].cumulatedLoss.has_value());
}

TEST_F(PayloadValidationTest, Mapping_DecimalAsString) {
    auto payload = mapOk(payloadJson(readingJson("2023-01-01T12:00:00,000+0000 S", "B", R"("12.5")")));
    EXPECT_DOUBLE_EQ(*payload.readings[0].value, 12.5);

    auto err = check(payloadJson(readingJson("2023-01-01T12:00:00,000+0000 S", "B", R"("twelve")")));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "RD[0].RV");
}

TEST_F(PayloadValidationTest, Mapping_ChargePointTypeZeroIsAbsent) {
    auto payload = mapOk(payloadJson(readingJson(), "T1", R"("CT":0,"CI":"")"));
    EXPECT_FALSE(payload.chargePointIdType.has_value());

    payload = mapOk(payloadJson(readingJson(), "T1", R"("CT":"EVSEID","CI":"DE*ABC*E123")"));
    EXPECT_EQ(payload.chargePointType(), ChargePointIdentificationType::EVSEID);
}

TEST_F(PayloadValidationTest, Mapping_ChargePointTypeTagged) {
    auto payload = mapOk(payloadJson(readingJson(), "T1", R"("CT":"CBIDC","CI":"0815")"));
    ASSERT_TRUE(payload.chargePointIdType.has_value());
    EXPECT_TRUE(payload.chargePointIdType->isKnown());
    EXPECT_EQ(payload.chargePointIdType->type, ChargePointIdentificationType::CBIDC);

    payload = mapOk(payloadJson(readingJson(), "T1", R"("CT":"VENDOR_CP","CI":"0815")"));
    ASSERT_TRUE(payload.chargePointIdType.has_value());
    EXPECT_FALSE(payload.chargePointIdType->isKnown());
    EXPECT_EQ(payload.chargePointIdType->toString(), "VENDOR_CP");
    EXPECT_FALSE(payload.chargePointType().has_value());

    payload = mapOk(payloadJson(readingJson(), "T1", R"("CT":7)"));
    ASSERT_TRUE(payload.chargePointIdType.has_value());
    EXPECT_EQ(payload.chargePointIdType->toString(), "7");
}

TEST_F(PayloadValidationTest, Mapping_IdentificationTagged) {
    auto payload = mapOk(payloadJson(readingJson(), "T1", R"("IT":"EVCOID","ID":"DE-8AA-123456-7")"));
    EXPECT_EQ(payload.identification.type, IdentificationType::EVCOID);
    EXPECT_EQ(payload.identification.value, std::optional<std::string>("DE-8AA-123456-7"));
    EXPECT_FALSE(validatePayload(payload));
}

TEST_F(PayloadValidationTest, Mapping_NullIdentificationTypeIsNone) {
    auto payload = mapOk(payloadJson(readingJson(), "T1", R"("IT":null)"));
    EXPECT_EQ(payload.identification.type, IdentificationType::NONE);
}

TEST_F(PayloadValidationTest, Mapping_ExtraFieldsKept) {
    auto payload = mapOk(payloadJson(readingJson(), "T1", R"("XV":{"vendor":true})"));
    ASSERT_EQ(payload.extraFields.count("XV"), 1u);
    EXPECT_TRUE(payload.extraFields["XV"]["vendor"].asBool());
}

TEST_F(PayloadValidationTest, Mapping_UnknownIdentificationFlag) {
    auto err = check(payloadJson(readingJson(), "T1", R"("IF":["RFID_PLAIN","NFC_MAGIC"])"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "IF[1]");
}

// =============================================================================
// Validation pipeline
// =============================================================================

TEST_F(PayloadValidationTest, Limits_TariffText) {
    std::string longText(251, 'x');
    auto err = check(payloadJson(readingJson(), "T1", R"("TT":")" + longText + R"(")"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "TT");

    EXPECT_FALSE(check(payloadJson(readingJson(), "T1", R"("TT":")" + std::string(250, 'x') + R"(")")));
}

TEST_F(PayloadValidationTest, Limits_ControllerFirmware) {
    auto err = check(payloadJson(readingJson(), "T1", R"("CF":")" + std::string(26, 'f') + R"(")"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "CF");
}

TEST_F(PayloadValidationTest, LossCompensation) {
    EXPECT_FALSE(check(payloadJson(readingJson(), "T1",
        R"("LC":{"LN":"cable","LI":1,"LR":1.5,"LU":"mOhm"})")));

    auto err = check(payloadJson(readingJson(), "T1", R"("LC":{"LN":"cable","LR":1.5,"LU":"kWh"})"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "LC.LU");

    err = check(payloadJson(readingJson(), "T1",
        R"("LC":{"LN":"a cable name that is too long","LR":1.5,"LU":"Ohm"})"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "LC.LN");

    err = check(payloadJson(readingJson(), "T1", R"("LC":{"LU":"Ohm"})"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "LC.LR");
}

TEST_F(PayloadValidationTest, SerialNumber_GatewayOrMeter) {
    const std::string noSerial =
        R"({"PG":"T1","IS":false,"RD":[)" + readingJson() + "]}";
    auto err = check(noSerial);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "GS/MS");
    EXPECT_EQ(err->message, "Either Gateway Serial (GS) or Meter Serial (MS) must be provided");

    const std::string meterOnly =
        R"({"PG":"T1","IS":false,"MS":"M1","GS":"","RD":[)" + readingJson() + "]}";
    EXPECT_FALSE(check(meterOnly));

    auto payload = mapOk(meterOnly);
    EXPECT_EQ(payload.serialNumber(), std::optional<std::string>("M1"));
}

TEST_F(PayloadValidationTest, SerialNumber_RequireMeterSerial) {
    ValidationOptions strict;
    strict.requireMeterSerial = true;

    auto err = check(payloadJson(), strict);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "MS");

    EXPECT_FALSE(check(payloadJson(readingJson(), "T1", R"("MS":"M1")"), strict));
}

TEST_F(PayloadValidationTest, ReadingErrorsArePrefixed) {
    auto err = check(payloadJson(readingJson() + "," +
        readingJson("2023-01-01T13:00:00,000+0000 S", "E", "20.0", R"("CL":-1.0)")));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "RD[1].CL");
}

TEST_F(PayloadValidationTest, IdentificationFlagMixing) {
    auto err = check(payloadJson(readingJson(), "T1", R"("IF":["RFID_PLAIN","OCPP_RS"])"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "IF");
}

TEST_F(PayloadValidationTest, IdentificationData) {
    EXPECT_FALSE(check(payloadJson(readingJson(), "T1", R"("IT":"ISO14443","ID":"1F2E3D4C")")));

    auto err = check(payloadJson(readingJson(), "T1", R"("IT":"ISO14443","ID":"XYZ")"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "ID");

    err = check(payloadJson(readingJson(), "T1", R"("IT":"NONE","ID":"1F2E3D4C")"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "ID");
}

TEST_F(PayloadValidationTest, TransactionSequence) {
    auto err = check(payloadJson(
        readingJson("2023-01-01T12:00:00,000+0000 S", "E") + "," +
        readingJson("2023-01-01T13:00:00,000+0000 S", "B")));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "RD[0].TX");
}

TEST_F(PayloadValidationTest, FirstViolationWins) {
    // Serial number is checked before readings and identification
    const std::string json =
        R"({"PG":"T1","IS":false,"IT":"NONE","ID":"abc","RD":[)" +
        readingJson("2023-01-01T12:00:00,000+0000 S", "B", "1.0", R"("EF":"x")") + "]}";
    auto err = check(json);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "GS/MS");
}
