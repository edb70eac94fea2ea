/**
 * @file signature_verifier.h
 * @brief ECDSA verification of OCMF payloads
 *
 * Pure functions, no shared state. A completed verification returns
 * true/false; an error is returned only when verification could not be
 * attempted (unsupported or mismatched algorithm, undecodable signature,
 * unusable key).
 */

#pragma once

#include "ocmf/common/error.h"
#include "ocmf/crypto/public_key.h"
#include "ocmf/model/signature.h"
#include <string>

namespace ocmf::crypto {

/**
 * @brief Verify a signature over the original payload bytes
 *
 * 1. Resolve curve and hash from SA (VERIFICATION error if unsupported)
 * 2. Decode SD per SE (HEX_DECODING / BASE64_DECODING error)
 * 3. Require the key curve to match SA (VERIFICATION error)
 * 4. ECDSA verify (DER signature) over the UTF-8 payload bytes
 *
 * @param originalPayload Payload JSON text exactly as received
 * @param signature Signature section
 * @param publicKey Decoded public key
 * @return true if valid, false if the signature does not verify
 */
Result<bool> verifySignature(const std::string& originalPayload,
                             const model::Signature& signature,
                             const PublicKey& publicKey);

/**
 * @brief Verify with key material given as hex or base64 text
 *
 * Same as above after PublicKey::fromString(); key decoding errors are
 * returned unchanged.
 */
Result<bool> verifySignature(const std::string& originalPayload,
                             const model::Signature& signature,
                             const std::string& publicKeyText);

} // namespace ocmf::crypto
