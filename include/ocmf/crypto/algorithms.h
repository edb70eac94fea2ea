/**
 * @file algorithms.h
 * @brief OCMF signature methods: curve and hash tables
 *
 * SA values follow "ECDSA-<curve>-<hash>". The tables are immutable and
 * shared by the signature parser and the verifier.
 */

#pragma once

#include <openssl/evp.h>
#include <optional>
#include <string>
#include <vector>

namespace ocmf::crypto {

/// @brief Default signature algorithm when SA is omitted
constexpr const char* DEFAULT_SIGNATURE_ALGORITHM = "ECDSA-secp256r1-SHA256";

/// @brief Elliptic curves named by OCMF
enum class CurveType {
    SECP192K1,
    SECP256K1,
    SECP192R1,
    SECP256R1,
    SECP384R1,
    SECP521R1,
    BRAINPOOL256R1,
    BRAINPOOLP256R1,  ///< Alternative spelling of BRAINPOOL256R1
    BRAINPOOL384R1
};

/// @brief OCMF curve name, e.g. "secp256r1", "brainpoolP256r1"
std::string toString(CurveType curve);
std::optional<CurveType> curveTypeFromString(const std::string& name);

/**
 * @brief OpenSSL NID for the curve
 *
 * secp192r1 and secp256r1 are the X9.62 prime192v1/prime256v1 curves. Both
 * brainpool 256 spellings map to NID_brainpoolP256r1.
 */
int curveNid(CurveType curve);

/**
 * @brief OCMF curve for an OpenSSL curve NID
 * @return Curve, or std::nullopt for curves OCMF does not use
 */
std::optional<CurveType> curveFromNid(int nid);

/// @brief True if both names denote the same curve
bool isSameCurve(CurveType a, CurveType b);

/// @brief Hash functions used with ECDSA in OCMF
enum class HashAlgorithm {
    SHA256,
    SHA512
};

std::string toString(HashAlgorithm hash);

/// @brief OpenSSL message digest (static object, not owned)
const EVP_MD* digestFor(HashAlgorithm hash);

/**
 * @brief Resolved SA value
 */
struct SignatureMethod {
    CurveType curve;
    HashAlgorithm hash;

    std::string toString() const;
};

/**
 * @brief Resolve an SA value
 * @param algorithm e.g. "ECDSA-brainpoolP256r1-SHA512"
 * @return Method, or std::nullopt if the combination is not one of the
 *         supported methods
 */
std::optional<SignatureMethod> resolveSignatureAlgorithm(const std::string& algorithm);

/// @brief All 18 supported SA values
const std::vector<std::string>& supportedSignatureAlgorithms();

} // namespace ocmf::crypto
