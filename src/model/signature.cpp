/**
 * @file signature.cpp
 * @brief Signature section decoding and validation
 */

#include "ocmf/model/signature.h"
#include "ocmf/crypto/algorithms.h"
#include "ocmf/utils/string_utils.h"

namespace ocmf::model {

std::string Signature::effectiveAlgorithm() const {
    return algorithm.value_or(crypto::DEFAULT_SIGNATURE_ALGORITHM);
}

Result<std::vector<uint8_t>> Signature::decodeData() const {
    if (effectiveEncoding() == SignatureEncoding::HEX) {
        auto bytes = utils::fromHex(data);
        if (!bytes) {
            return Error(ErrorKind::HEX_DECODING, "SD", "SD is not a valid hexadecimal string");
        }
        return std::move(*bytes);
    }

    auto bytes = utils::fromBase64(data);
    if (!bytes) {
        return Error(ErrorKind::BASE64_DECODING, "SD", "SD is not a valid base64 string");
    }
    return std::move(*bytes);
}

Status validateSignature(const Signature& signature) {
    std::string sa = signature.effectiveAlgorithm();
    if (!crypto::resolveSignatureAlgorithm(sa)) {
        return Error(ErrorKind::VALIDATION, "SA", "Unsupported signature algorithm '" + sa + "'");
    }

    if (signature.data.empty()) {
        return Error(ErrorKind::VALIDATION, "SD", "SD (Signature Data) must not be empty");
    }

    auto decoded = signature.decodeData();
    if (!decoded) {
        return decoded.error();
    }

    return std::nullopt;
}

} // namespace ocmf::model
