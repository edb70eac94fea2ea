/**
 * @file test_ocmf.cpp
 * @brief Unit tests for record-level verification and compliance
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include "ocmf/ocmf.h"
#include "test_helpers.h"

using namespace ocmf;
using namespace ocmf::test;

class OcmfTest : public ::testing::Test {
protected:
    static model::OcmfRecord parseOk(const std::string& text) {
        auto record = codec::parse(text);
        if (!record) {
            throw std::runtime_error(record.error().toString());
        }
        return std::move(record).value();
    }

    static std::string transactionRecord(const std::string& pagination,
                                         const std::string& tm,
                                         const std::string& tx,
                                         const std::string& rv) {
        return ocmfString(payloadJson(readingJson(tm, tx, rv), pagination));
    }
};

// =============================================================================
// Signature
// =============================================================================

TEST_F(OcmfTest, VerifySignature_Keba) {
    auto record = parseOk(KEBA_OCMF);
    auto result = verifySignature(record, KEBA_PUBLIC_KEY);
    ASSERT_TRUE(result) << result.error().toString();
    EXPECT_TRUE(result.value());
}

TEST_F(OcmfTest, VerifySignature_KebaHexEncoded) {
    auto record = parseOk(utils::toHex(std::vector<uint8_t>(KEBA_OCMF.begin(), KEBA_OCMF.end())));
    auto result = verifySignature(record, KEBA_PUBLIC_KEY);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value());
}

TEST_F(OcmfTest, VerifySignature_NoKeyAvailable) {
    auto record = parseOk(KEBA_OCMF);
    auto result = verifySignature(record);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::VERIFICATION);
    EXPECT_EQ(result.error().field, "PK");
}

TEST_F(OcmfTest, VerifySignature_EmbeddedKey) {
    auto key = generateEcKey();
    ASSERT_NE(key, nullptr);

    const std::string payload = payloadJson();
    const std::string signature = R"({"SA":"ECDSA-secp256r1-SHA256","SD":")" +
                                  signHex(key.get(), payload) + R"(","PK":")" +
                                  publicKeyHex(key.get()) + R"("})";
    auto record = parseOk(ocmfString(payload, signature));

    auto result = verifySignature(record);
    ASSERT_TRUE(result) << result.error().toString();
    EXPECT_TRUE(result.value());

    // An explicit key takes precedence over the embedded one
    auto other = verifySignature(record, OTHER_P256_PUBLIC_KEY);
    ASSERT_TRUE(other);
    EXPECT_FALSE(other.value());
}

// =============================================================================
// Compliance
// =============================================================================

TEST_F(OcmfTest, CheckCompliance_KebaSingleRecord) {
    auto record = parseOk(KEBA_OCMF);

    // Informative and relative time statuses are warnings only
    auto issues = checkCompliance(record);
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].code, eichrecht::IssueCode::TIME_SYNC);
    EXPECT_EQ(issues[1].code, eichrecht::IssueCode::TIME_SYNC);

    EXPECT_TRUE(checkCompliance(record, nullptr, true).empty());
    EXPECT_TRUE(isCompliant(record));
}

TEST_F(OcmfTest, CheckCompliance_SingleRecordReadingErrors) {
    auto record = parseOk(ocmfString(payloadJson(
        readingJson("2023-01-01T12:00:00,000+0000 S", "B", "1.0") + "," +
        R"({"TM":"2023-01-01T13:00:00,000+0000 S","TX":"E","RV":2.0,)"
        R"("RI":"01-00:B2.08.00*FF","RU":"kWh","ST":"M"})")));
    EXPECT_FALSE(isCompliant(record));

    auto issues = checkCompliance(record, nullptr, true);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].code, eichrecht::IssueCode::METER_STATUS);
}

TEST_F(OcmfTest, CheckCompliance_NoReadings) {
    auto record = parseOk(ocmfString(R"({"PG":"T1","IS":false,"GS":"1","RD":[]})"));
    auto issues = checkCompliance(record);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].code, eichrecht::IssueCode::NO_READINGS);
    EXPECT_FALSE(isCompliant(record));
}

TEST_F(OcmfTest, TransactionPair_Valid) {
    auto begin = parseOk(transactionRecord("T7", "2023-01-01T12:00:00,000+0000 S", "B", "100.0"));
    auto end = parseOk(transactionRecord("T8", "2023-01-01T13:00:00,000+0000 S", "E", "112.25"));

    EXPECT_TRUE(validateTransactionPair(begin, end));
    EXPECT_TRUE(checkCompliance(begin, &end).empty());
}

TEST_F(OcmfTest, TransactionPair_Invalid) {
    auto begin = parseOk(transactionRecord("T7", "2023-01-01T12:00:00,000+0000 S", "B", "100.0"));
    auto end = parseOk(transactionRecord("T9", "2023-01-01T13:00:00,000+0000 S", "E", "90.0"));

    EXPECT_FALSE(validateTransactionPair(begin, end));

    auto issues = checkCompliance(begin, &end, true);
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].code, eichrecht::IssueCode::VALUE_REGRESSION);
    EXPECT_EQ(issues[1].code, eichrecht::IssueCode::PAGINATION_INCONSISTENT);
}

TEST_F(OcmfTest, TransactionPair_PolicyPassedThrough) {
    auto begin = parseOk(ocmfString(payloadJson(readingJson(), "T1", R"("IT":"ISO14443","ID":"1F2E3D4C")")));
    auto end = parseOk(ocmfString(payloadJson(
        readingJson("2023-01-01T13:00:00,000+0000 S", "E", "60.0"), "T2", R"("IT":"ISO14443","ID":"5A6B7C8D")")));

    EXPECT_TRUE(validateTransactionPair(begin, end));

    eichrecht::CompliancePolicy strict;
    strict.idMismatchSeverity = eichrecht::IssueSeverity::ERROR;
    EXPECT_FALSE(validateTransactionPair(begin, end, strict));
    EXPECT_EQ(checkCompliance(begin, &end, true, strict).size(), 1u);
}

// =============================================================================
// Combined verification
// =============================================================================

TEST_F(OcmfTest, Verify_Keba) {
    auto record = parseOk(KEBA_OCMF);
    auto result = verify(record, KEBA_PUBLIC_KEY);
    ASSERT_TRUE(result) << result.error().toString();
    EXPECT_TRUE(result.value().signatureValid);
    EXPECT_EQ(result.value().issues.size(), 2u);
    EXPECT_FALSE(eichrecht::hasErrors(result.value().issues));
}

TEST_F(OcmfTest, Verify_WithoutCompliance) {
    auto record = parseOk(KEBA_OCMF);
    auto result = verify(record, KEBA_PUBLIC_KEY, nullptr, false);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().signatureValid);
    EXPECT_TRUE(result.value().issues.empty());
}

TEST_F(OcmfTest, Verify_TamperedRecord) {
    auto record = parseOk(replaceFirst(KEBA_OCMF, "\"RV\":0.2596", "\"RV\":999.9999"));
    auto result = verify(record, KEBA_PUBLIC_KEY);
    ASSERT_TRUE(result);
    EXPECT_FALSE(result.value().signatureValid);
}

TEST_F(OcmfTest, Verify_KeyErrorPropagates) {
    auto record = parseOk(KEBA_OCMF);
    auto result = verify(record, SECP192R1_PUBLIC_KEY);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::VERIFICATION);
}
