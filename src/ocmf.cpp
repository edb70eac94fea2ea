/**
 * @file ocmf.cpp
 * @brief Record-level OCMF operations
 */

#include "ocmf/ocmf.h"
#include <spdlog/spdlog.h>

namespace ocmf {

Result<bool> verifySignature(const model::OcmfRecord& record, const std::string& publicKey) {
    std::string key = publicKey;
    if (key.empty()) {
        if (!record.signature().publicKey || record.signature().publicKey->empty()) {
            return Error(ErrorKind::VERIFICATION, "PK",
                         "Public key is required for signature verification");
        }
        spdlog::debug("[Ocmf] No public key supplied, using embedded PK");
        key = *record.signature().publicKey;
    }

    return crypto::verifySignature(record.originalPayload(), record.signature(), key);
}

std::vector<eichrecht::EichrechtIssue> checkCompliance(
    const model::OcmfRecord& record,
    const model::OcmfRecord* other,
    bool errorsOnly,
    const eichrecht::CompliancePolicy& policy) {
    std::vector<eichrecht::EichrechtIssue> issues;

    if (other) {
        issues = eichrecht::checkTransaction(record.payload(), other->payload(), policy);
    } else {
        const auto& readings = record.payload().readings;
        if (readings.empty()) {
            eichrecht::EichrechtIssue issue;
            issue.code = eichrecht::IssueCode::NO_READINGS;
            issue.message = "No readings (RD) present in payload";
            issue.field = "RD";
            issues.push_back(issue);
        }
        for (size_t i = 0; i < readings.size(); ++i) {
            auto readingIssues = eichrecht::checkReading(readings[i], i == 0 && readings[i].isBegin());
            issues.insert(issues.end(), readingIssues.begin(), readingIssues.end());
        }
    }

    if (errorsOnly) {
        return eichrecht::filterErrors(issues);
    }
    return issues;
}

bool isCompliant(const model::OcmfRecord& record) {
    return checkCompliance(record, nullptr, true).empty();
}

bool validateTransactionPair(const model::OcmfRecord& begin,
                             const model::OcmfRecord& end,
                             const eichrecht::CompliancePolicy& policy) {
    return eichrecht::validateTransactionPair(begin.payload(), end.payload(), policy);
}

Result<VerificationResult> verify(const model::OcmfRecord& record,
                                  const std::string& publicKey,
                                  const model::OcmfRecord* other,
                                  bool checkEichrecht) {
    auto valid = verifySignature(record, publicKey);
    if (!valid) {
        return valid.error();
    }

    VerificationResult result;
    result.signatureValid = valid.value();
    if (checkEichrecht) {
        result.issues = checkCompliance(record, other);
    }
    return result;
}

} // namespace ocmf
