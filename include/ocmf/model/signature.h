/**
 * @file signature.h
 * @brief OCMF signature section
 */

#pragma once

#include "ocmf/common/error.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ocmf::model {

/// @brief Encoding of SD
enum class SignatureEncoding {
    HEX,
    BASE64
};

inline std::string toString(SignatureEncoding encoding) {
    return encoding == SignatureEncoding::HEX ? "hex" : "base64";
}

inline std::optional<SignatureEncoding> signatureEncodingFromString(const std::string& str) {
    if (str == "hex") return SignatureEncoding::HEX;
    if (str == "base64") return SignatureEncoding::BASE64;
    return std::nullopt;
}

/// @brief Default MIME type when SM is omitted
constexpr const char* DEFAULT_SIGNATURE_MIME_TYPE = "application/x-der";

/**
 * @brief Signature section
 *
 * Optional members keep whether a key was present on the wire; the
 * effective*() accessors apply the OCMF defaults.
 */
struct Signature {
    std::optional<std::string> algorithm;         ///< SA
    std::optional<SignatureEncoding> encoding;    ///< SE
    std::optional<std::string> mimeType;          ///< SM (informational)
    std::string data;                             ///< SD (required)
    std::optional<std::string> publicKey;         ///< PK (embedded key, testing only)

    std::string effectiveAlgorithm() const;
    SignatureEncoding effectiveEncoding() const { return encoding.value_or(SignatureEncoding::HEX); }
    std::string effectiveMimeType() const { return mimeType.value_or(DEFAULT_SIGNATURE_MIME_TYPE); }

    /**
     * @brief Decode SD according to SE
     * @return Signature bytes, or HEX_DECODING / BASE64_DECODING error on field "SD"
     */
    Result<std::vector<uint8_t>> decodeData() const;

    bool operator==(const Signature& other) const {
        return algorithm == other.algorithm && encoding == other.encoding &&
               mimeType == other.mimeType && data == other.data && publicKey == other.publicKey;
    }
    bool operator!=(const Signature& other) const { return !(*this == other); }
};

/**
 * @brief Validate the signature section
 *
 * SA must be a supported method and SD must be non-empty and decodable
 * with SE.
 *
 * @return std::nullopt if valid, error otherwise
 */
Status validateSignature(const Signature& signature);

} // namespace ocmf::model
