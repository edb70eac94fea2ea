/**
 * @file ocmf_record.h
 * @brief Parsed OCMF record
 */

#pragma once

#include "ocmf/model/payload.h"
#include "ocmf/model/signature.h"
#include <string>
#include <utility>

namespace ocmf::model {

/**
 * @brief OCMF|payload|signature, immutable once built
 *
 * Keeps the payload JSON text exactly as received. The signature covers those
 * bytes, so verification must use originalPayload() and never a
 * re-serialized payload.
 */
class OcmfRecord {
public:
    static constexpr const char* HEADER = "OCMF";

    OcmfRecord(Payload payload, Signature signature, std::string originalPayload)
        : payload_(std::move(payload)),
          signature_(std::move(signature)),
          originalPayload_(std::move(originalPayload)) {}

    const Payload& payload() const { return payload_; }
    const Signature& signature() const { return signature_; }

    /// @brief Payload JSON text as it appeared between the first two '|'
    const std::string& originalPayload() const { return originalPayload_; }

    /// @brief Value equality of payload and signature (original text ignored)
    bool sameContent(const OcmfRecord& other) const {
        return payload_ == other.payload_ && signature_ == other.signature_;
    }

private:
    Payload payload_;
    Signature signature_;
    std::string originalPayload_;
};

} // namespace ocmf::model
