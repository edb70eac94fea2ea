/**
 * @file test_ocmf_codec.cpp
 * @brief Unit tests for OCMF string parsing and serialization
 */

#include <gtest/gtest.h>
#include "ocmf/codec/ocmf_codec.h"
#include "test_helpers.h"

using namespace ocmf;
using namespace ocmf::test;

class OcmfCodecTest : public ::testing::Test {
protected:
    static std::string toHexString(const std::string& text) {
        return utils::toHex(std::vector<uint8_t>(text.begin(), text.end()));
    }
};

TEST_F(OcmfCodecTest, Parse_Keba) {
    auto record = codec::parse(KEBA_OCMF);
    ASSERT_TRUE(record) << record.error().toString();

    const auto& payload = record.value().payload();
    EXPECT_EQ(payload.gatewayId, std::optional<std::string>("KEBA_KCP30"));
    EXPECT_EQ(payload.pagination.toString(), "T32");
    ASSERT_EQ(payload.readings.size(), 2u);
    EXPECT_TRUE(payload.readings[0].isBegin());
    EXPECT_TRUE(payload.readings[1].isEnd());

    const auto& signature = record.value().signature();
    EXPECT_EQ(signature.data, KEBA_SIGNATURE_DATA);
    EXPECT_FALSE(signature.algorithm.has_value());
    EXPECT_EQ(signature.effectiveAlgorithm(), "ECDSA-secp256r1-SHA256");
    EXPECT_EQ(signature.effectiveMimeType(), "application/x-der");
}

TEST_F(OcmfCodecTest, Parse_KeepsOriginalPayloadVerbatim) {
    auto record = codec::parse(KEBA_OCMF);
    ASSERT_TRUE(record);
    EXPECT_EQ(record.value().originalPayload(), KEBA_PAYLOAD);
}

TEST_F(OcmfCodecTest, Parse_TrimsWhitespace) {
    auto record = codec::parse("  \n" + KEBA_OCMF + "\r\n");
    ASSERT_TRUE(record);
    EXPECT_EQ(record.value().originalPayload(), KEBA_PAYLOAD);
}

TEST_F(OcmfCodecTest, Parse_HexEncoded) {
    auto plain = codec::parse(KEBA_OCMF);
    auto hex = codec::parse(toHexString(KEBA_OCMF));
    ASSERT_TRUE(plain);
    ASSERT_TRUE(hex) << hex.error().toString();
    EXPECT_TRUE(plain.value().sameContent(hex.value()));
    EXPECT_EQ(hex.value().originalPayload(), KEBA_PAYLOAD);
}

TEST_F(OcmfCodecTest, Parse_SeparatorInsideSignature) {
    auto record = codec::parse(ocmfString(payloadJson(),
        R"({"SD":"3046022100abcd1234","PK":"a|b"})"));
    ASSERT_TRUE(record) << record.error().toString();
    EXPECT_EQ(record.value().signature().publicKey, std::optional<std::string>("a|b"));
}

// =============================================================================
// Error kinds
// =============================================================================

TEST_F(OcmfCodecTest, Parse_NotHexNotOcmf) {
    auto record = codec::parse("hello world");
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::HEX_DECODING);
}

TEST_F(OcmfCodecTest, Parse_HexNotUtf8) {
    auto record = codec::parse("c328");
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::HEX_DECODING);
}

TEST_F(OcmfCodecTest, Parse_WrongHeader) {
    auto record = codec::parse(toHexString("OCMX|{}|{}"));
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::FORMAT);
}

TEST_F(OcmfCodecTest, Parse_MissingSection) {
    auto record = codec::parse("OCMF|" + payloadJson());
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::FORMAT);
}

TEST_F(OcmfCodecTest, Parse_EmptyInput) {
    auto record = codec::parse("   ");
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::FORMAT);
}

TEST_F(OcmfCodecTest, Parse_InvalidPayloadJson) {
    auto record = codec::parse(ocmfString("{not json"));
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::PAYLOAD);
    ASSERT_NE(record.error().cause, nullptr);
    EXPECT_EQ(record.error().rootCause().kind, ErrorKind::FORMAT);
}

TEST_F(OcmfCodecTest, Parse_PayloadNotObject) {
    auto record = codec::parse(ocmfString("[1,2]"));
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::PAYLOAD);
}

TEST_F(OcmfCodecTest, Parse_DuplicatePayloadKey) {
    auto record = codec::parse(ocmfString(R"({"PG":"T1","PG":"T2","IS":false,"GS":"1","RD":[]})"));
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::PAYLOAD);
}

TEST_F(OcmfCodecTest, Parse_PayloadValidationFailure) {
    auto record = codec::parse(ocmfString(payloadJson(readingJson(), "T0")));
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::PAYLOAD);
    EXPECT_EQ(record.error().field, "PG");
    EXPECT_EQ(record.error().rootCause().kind, ErrorKind::VALIDATION);
    EXPECT_EQ(record.error().message.rfind("Invalid payload: ", 0), 0u);
}

TEST_F(OcmfCodecTest, Parse_StrictMeterSerialOption) {
    model::ValidationOptions strict;
    strict.requireMeterSerial = true;

    auto record = codec::parse(ocmfString(payloadJson()), strict);
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().field, "MS");
}

TEST_F(OcmfCodecTest, Parse_SignatureMissingData) {
    auto record = codec::parse(ocmfString(payloadJson(), R"({"SA":"ECDSA-secp256r1-SHA256"})"));
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::SIGNATURE);
    EXPECT_EQ(record.error().field, "SD");
}

TEST_F(OcmfCodecTest, Parse_SignatureUnsupportedAlgorithm) {
    auto record = codec::parse(ocmfString(payloadJson(), R"({"SA":"RSA-2048-SHA256","SD":"00"})"));
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::SIGNATURE);
    EXPECT_EQ(record.error().field, "SA");
}

TEST_F(OcmfCodecTest, Parse_SignatureNotHex) {
    auto record = codec::parse(ocmfString(payloadJson(), R"({"SD":"xyz"})"));
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().kind, ErrorKind::SIGNATURE);
    EXPECT_EQ(record.error().rootCause().kind, ErrorKind::HEX_DECODING);
}

TEST_F(OcmfCodecTest, Parse_SignatureBase64) {
    auto record = codec::parse(ocmfString(payloadJson(), R"({"SE":"base64","SD":"MEUCIQ=="})"));
    ASSERT_TRUE(record) << record.error().toString();
    auto bytes = record.value().signature().decodeData();
    ASSERT_TRUE(bytes);
    EXPECT_EQ(bytes.value().size(), 4u);

    record = codec::parse(ocmfString(payloadJson(), R"({"SE":"base64","SD":"MEUC*Q=="})"));
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().rootCause().kind, ErrorKind::BASE64_DECODING);
}

TEST_F(OcmfCodecTest, Parse_UnknownSignatureEncoding) {
    auto record = codec::parse(ocmfString(payloadJson(), R"({"SE":"binary","SD":"00"})"));
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().field, "SE");
}

// =============================================================================
// Serialization
// =============================================================================

TEST_F(OcmfCodecTest, Serialize_ReparsesToSameContent) {
    auto record = codec::parse(KEBA_OCMF);
    ASSERT_TRUE(record);

    std::string text = codec::serialize(record.value());
    EXPECT_EQ(text.rfind("OCMF|", 0), 0u);

    auto reparsed = codec::parse(text);
    ASSERT_TRUE(reparsed) << reparsed.error().toString();
    EXPECT_TRUE(record.value().sameContent(reparsed.value()));
}

TEST_F(OcmfCodecTest, Serialize_KeepsFullDoublePrecision) {
    const std::string readings =
        R"({"TM":"2023-01-01T12:00:00,000+0000 S","TX":"B","RV":1234567.123456789,)"
        R"("RI":"01-00:B2.08.00*FF","RU":"kWh","ST":"G","CL":0},)"
        R"({"TM":"2023-01-01T13:00:00,000+0000 S","TX":"E","RV":1234567.8901234567,)"
        R"("RI":"01-00:B2.08.00*FF","RU":"kWh","ST":"G","CL":0.12345678901234566})";
    auto record = codec::parse(ocmfString(payloadJson(readings, "T1",
        R"("LC":{"LR":1.0000000000000002,"LU":"mOhm"})")));
    ASSERT_TRUE(record) << record.error().toString();

    auto reparsed = codec::parse(codec::serialize(record.value()));
    ASSERT_TRUE(reparsed) << reparsed.error().toString();
    EXPECT_TRUE(record.value().sameContent(reparsed.value()));

    const auto& payload = reparsed.value().payload();
    ASSERT_EQ(payload.readings.size(), 2u);
    EXPECT_EQ(*payload.readings[0].value, 1234567.123456789);
    EXPECT_EQ(*payload.readings[1].value, 1234567.8901234567);
    EXPECT_EQ(*payload.readings[1].cumulatedLoss, 0.12345678901234566);
    ASSERT_TRUE(payload.lossCompensation.has_value());
    EXPECT_EQ(payload.lossCompensation->resistance, 1.0000000000000002);
}

TEST_F(OcmfCodecTest, Serialize_ReparsesFullFeaturedPayload) {
    const std::string readings =
        R"({"TM":"2023-01-01T12:00:00,000+0000 S","TX":"B","RV":2935.6,)"
        R"("RI":"1-0:1.8.0*198","RU":"kWh","ST":"G"},)"
        R"({"TM":"2023-01-01T13:00:00,000+0000 S","TX":"E","RV":2947.31,)"
        R"("RI":"01-00:B2.08.00*FF","RU":"Wh","ST":"G","CL":0.25,"EF":"t"})";
    const std::string extra =
        R"("IF":["RFID_PLAIN","RFID_RELATED"],"IT":"ISO14443","ID":"1F2E3D4C",)"
        R"("CT":"EVSEID","CI":"DE*ABC*E123456","TT":"0,25 EUR/kWh","CF":"1.4.2",)"
        R"("LC":{"LN":"cable-7m","LI":3,"LR":1.5,"LU":"mOhm"},)"
        R"("XV":"vendor","YZ":{"nested":[1,2.5,"three"]})";
    auto record = codec::parse(ocmfString(payloadJson(readings, "F42", extra),
        R"({"SA":"ECDSA-secp384r1-SHA384","SE":"base64","SM":"application/x-der","SD":"MEUCIQ=="})"));
    ASSERT_TRUE(record) << record.error().toString();

    auto reparsed = codec::parse(codec::serialize(record.value()));
    ASSERT_TRUE(reparsed) << reparsed.error().toString();
    EXPECT_TRUE(record.value().sameContent(reparsed.value()));

    const auto& payload = reparsed.value().payload();
    EXPECT_EQ(payload.pagination.toString(), "F42");
    EXPECT_EQ(payload.identificationFlags.size(), 2u);
    EXPECT_EQ(payload.identification.type, model::IdentificationType::ISO14443);
    EXPECT_EQ(payload.chargePointType(), model::ChargePointIdentificationType::EVSEID);
    ASSERT_EQ(payload.readings.size(), 2u);
    ASSERT_TRUE(payload.readings[0].obis.has_value());
    EXPECT_EQ(payload.readings[0].obis->toString(), "1-0:1.8.0*198");
    EXPECT_EQ(payload.readings[1].cumulatedLoss, std::optional<double>(0.25));
    EXPECT_EQ(payload.extraFields.count("XV"), 1u);
    EXPECT_EQ(payload.extraFields.count("YZ"), 1u);
    EXPECT_EQ(reparsed.value().signature().effectiveAlgorithm(), "ECDSA-secp384r1-SHA384");
}

TEST_F(OcmfCodecTest, Serialize_Hex) {
    auto record = codec::parse(KEBA_OCMF);
    ASSERT_TRUE(record);

    std::string hex = codec::serialize(record.value(), true);
    EXPECT_TRUE(utils::isHexString(hex));

    auto reparsed = codec::parse(hex);
    ASSERT_TRUE(reparsed);
    EXPECT_TRUE(record.value().sameContent(reparsed.value()));
}

TEST_F(OcmfCodecTest, Serialize_ExtraFieldsSurvive) {
    auto record = codec::parse(ocmfString(payloadJson(readingJson(), "T1", R"("XV":"vendor")")));
    ASSERT_TRUE(record);
    std::string text = codec::serialize(record.value());
    EXPECT_NE(text.find(R"("XV":"vendor")"), std::string::npos);
}
