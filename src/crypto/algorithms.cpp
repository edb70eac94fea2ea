/**
 * @file algorithms.cpp
 * @brief Curve and hash tables
 */

#include "ocmf/crypto/algorithms.h"
#include <openssl/obj_mac.h>

namespace ocmf::crypto {

namespace {

struct CurveEntry {
    CurveType curve;
    const char* name;
    int nid;
};

const CurveEntry kCurves[] = {
    {CurveType::SECP192K1,       "secp192k1",       NID_secp192k1},
    {CurveType::SECP256K1,       "secp256k1",       NID_secp256k1},
    {CurveType::SECP192R1,       "secp192r1",       NID_X9_62_prime192v1},
    {CurveType::SECP256R1,       "secp256r1",       NID_X9_62_prime256v1},
    {CurveType::SECP384R1,       "secp384r1",       NID_secp384r1},
    {CurveType::SECP521R1,       "secp521r1",       NID_secp521r1},
    {CurveType::BRAINPOOL256R1,  "brainpool256r1",  NID_brainpoolP256r1},
    {CurveType::BRAINPOOLP256R1, "brainpoolP256r1", NID_brainpoolP256r1},
    {CurveType::BRAINPOOL384R1,  "brainpool384r1",  NID_brainpoolP384r1},
};

const char* const kSignatureAlgorithmPrefix = "ECDSA-";

} // namespace

std::string toString(CurveType curve) {
    for (const auto& entry : kCurves) {
        if (entry.curve == curve) {
            return entry.name;
        }
    }
    return "";
}

std::optional<CurveType> curveTypeFromString(const std::string& name) {
    for (const auto& entry : kCurves) {
        if (name == entry.name) {
            return entry.curve;
        }
    }
    return std::nullopt;
}

int curveNid(CurveType curve) {
    for (const auto& entry : kCurves) {
        if (entry.curve == curve) {
            return entry.nid;
        }
    }
    return NID_undef;
}

std::optional<CurveType> curveFromNid(int nid) {
    // OpenSSL's own spelling for the brainpool 256 curve
    if (nid == NID_brainpoolP256r1) {
        return CurveType::BRAINPOOLP256R1;
    }
    for (const auto& entry : kCurves) {
        if (entry.nid == nid) {
            return entry.curve;
        }
    }
    return std::nullopt;
}

bool isSameCurve(CurveType a, CurveType b) {
    return curveNid(a) == curveNid(b);
}

std::string toString(HashAlgorithm hash) {
    return hash == HashAlgorithm::SHA256 ? "SHA256" : "SHA512";
}

const EVP_MD* digestFor(HashAlgorithm hash) {
    return hash == HashAlgorithm::SHA256 ? EVP_sha256() : EVP_sha512();
}

std::string SignatureMethod::toString() const {
    return std::string(kSignatureAlgorithmPrefix) + crypto::toString(curve) + "-" + crypto::toString(hash);
}

std::optional<SignatureMethod> resolveSignatureAlgorithm(const std::string& algorithm) {
    const std::string prefix = kSignatureAlgorithmPrefix;
    if (algorithm.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    size_t dash = algorithm.rfind('-');
    if (dash == std::string::npos || dash < prefix.size()) {
        return std::nullopt;
    }

    auto curve = curveTypeFromString(algorithm.substr(prefix.size(), dash - prefix.size()));
    if (!curve) {
        return std::nullopt;
    }

    std::string hashName = algorithm.substr(dash + 1);
    if (hashName == "SHA256") {
        return SignatureMethod{*curve, HashAlgorithm::SHA256};
    }
    if (hashName == "SHA512") {
        return SignatureMethod{*curve, HashAlgorithm::SHA512};
    }
    return std::nullopt;
}

const std::vector<std::string>& supportedSignatureAlgorithms() {
    static const std::vector<std::string> algorithms = [] {
        std::vector<std::string> list;
        for (HashAlgorithm hash : {HashAlgorithm::SHA256, HashAlgorithm::SHA512}) {
            for (const auto& entry : kCurves) {
                list.push_back(SignatureMethod{entry.curve, hash}.toString());
            }
        }
        return list;
    }();
    return algorithms;
}

} // namespace ocmf::crypto
