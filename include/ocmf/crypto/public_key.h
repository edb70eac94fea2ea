/**
 * @file public_key.h
 * @brief EC public key decoding and metadata
 */

#pragma once

#include "ocmf/common/error.h"
#include "ocmf/crypto/algorithms.h"
#include <openssl/evp.h>
#include <cstdint>
#include <string>
#include <vector>

namespace ocmf::crypto {

/**
 * @brief Decoded EC public key (SubjectPublicKeyInfo DER)
 *
 * Immutable value holding the DER bytes and the metadata extracted from
 * them: curve, key size and block length.
 */
class PublicKey {
public:
    /**
     * @brief Decode key text
     *
     * Tries hex, then base64, then parses the bytes as DER
     * SubjectPublicKeyInfo. If DER parsing fails and the input is exactly
     * 64 bytes, it is taken as raw secp256r1 X||Y coordinates.
     *
     * @param text Hex or base64 key material (surrounding whitespace ignored)
     * @return Key, BASE64_DECODING error if the text is neither hex nor
     *         base64, PUBLIC_KEY error if the bytes are not a supported EC key
     */
    static Result<PublicKey> fromString(const std::string& text);

    /**
     * @brief Parse DER SubjectPublicKeyInfo bytes
     * @return Key, or PUBLIC_KEY error
     */
    static Result<PublicKey> fromDer(const std::vector<uint8_t>& der);

    CurveType curve() const { return curve_; }
    int keySizeBits() const { return keySizeBits_; }
    int blockLengthBytes() const { return keySizeBits_ / 8; }
    const std::vector<uint8_t>& der() const { return der_; }

    /// @brief DER as lowercase hex, or base64 if requested
    std::string toString(bool base64 = false) const;

    /// @brief OCMF key type, e.g. "ECDSA-secp256r1"
    std::string keyTypeIdentifier() const;

    /// @brief True if the SA value names this key's curve
    bool matchesSignatureAlgorithm(const std::string& algorithm) const;

    /**
     * @brief Create an OpenSSL key object
     * @return New EVP_PKEY (caller must free with EVP_PKEY_free), nullptr on failure
     */
    EVP_PKEY* toEvpKey() const;

private:
    PublicKey(std::vector<uint8_t> der, CurveType curve, int keySizeBits)
        : der_(std::move(der)), curve_(curve), keySizeBits_(keySizeBits) {}

    std::vector<uint8_t> der_;
    CurveType curve_;
    int keySizeBits_;
};

} // namespace ocmf::crypto
