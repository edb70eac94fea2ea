/**
 * @file signature_verifier.cpp
 * @brief ECDSA verification with OpenSSL EVP
 */

#include "ocmf/crypto/signature_verifier.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace ocmf::crypto {

namespace {

Result<SignatureMethod> resolveMethod(const model::Signature& signature) {
    const std::string algorithm = signature.effectiveAlgorithm();
    auto method = resolveSignatureAlgorithm(algorithm);
    if (!method) {
        return Error(ErrorKind::VERIFICATION, "SA",
                     "Unsupported signature algorithm: " + algorithm);
    }
    return *method;
}

} // namespace

Result<bool> verifySignature(const std::string& originalPayload,
                             const model::Signature& signature,
                             const PublicKey& publicKey) {
    const std::string algorithm = signature.effectiveAlgorithm();
    auto method = resolveMethod(signature);
    if (!method) {
        return method.error();
    }

    auto signatureBytes = signature.decodeData();
    if (!signatureBytes) {
        return signatureBytes.error();
    }

    if (!isSameCurve(method.value().curve, publicKey.curve())) {
        return Error(ErrorKind::VERIFICATION, "SA",
                     "Public key curve mismatch: signature algorithm specifies '" +
                     toString(method.value().curve) + "' but public key uses '" +
                     toString(publicKey.curve()) + "'");
    }

    EVP_PKEY* pkey = publicKey.toEvpKey();
    if (!pkey) {
        spdlog::warn("[SignatureVerifier] Failed to load decoded public key");
        return Error(ErrorKind::VERIFICATION, "PK", "Failed to load public key");
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        EVP_PKEY_free(pkey);
        return Error(ErrorKind::VERIFICATION, "", "Failed to allocate digest context");
    }

    if (EVP_DigestVerifyInit(ctx, nullptr, digestFor(method.value().hash), nullptr, pkey) != 1) {
        unsigned long err = ERR_get_error();
        char errBuf[256];
        ERR_error_string_n(err, errBuf, sizeof(errBuf));
        ERR_clear_error();
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        spdlog::warn("[SignatureVerifier] EVP_DigestVerifyInit failed: {}", errBuf);
        return Error(ErrorKind::VERIFICATION, "",
                     std::string("Signature verification could not be initialized: ") + errBuf);
    }

    const auto& sig = signatureBytes.value();
    int rc = EVP_DigestVerify(ctx, sig.data(), sig.size(),
                              reinterpret_cast<const unsigned char*>(originalPayload.data()),
                              originalPayload.size());

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);

    // 0 = bad signature, < 0 = malformed signature encoding; both are a failed verification
    if (rc != 1) {
        ERR_clear_error();
    }

    spdlog::debug("[SignatureVerifier] {} with {}: {}", algorithm,
                  publicKey.keyTypeIdentifier(), rc == 1 ? "valid" : "invalid");
    return rc == 1;
}

Result<bool> verifySignature(const std::string& originalPayload,
                             const model::Signature& signature,
                             const std::string& publicKeyText) {
    // Algorithm and signature data problems take precedence over key problems
    auto method = resolveMethod(signature);
    if (!method) {
        return method.error();
    }
    auto signatureBytes = signature.decodeData();
    if (!signatureBytes) {
        return signatureBytes.error();
    }

    auto key = PublicKey::fromString(publicKeyText);
    if (!key) {
        spdlog::debug("[SignatureVerifier] Public key rejected: {}", key.error().toString());
        return key.error();
    }
    return verifySignature(originalPayload, signature, key.value());
}

} // namespace ocmf::crypto
