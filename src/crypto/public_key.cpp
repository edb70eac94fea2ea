/**
 * @file public_key.cpp
 * @brief EC public key decoding with OpenSSL
 */

#include "ocmf/crypto/public_key.h"
#include "ocmf/utils/string_utils.h"
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>

namespace ocmf::crypto {

namespace {

constexpr size_t RAW_P256_KEY_LENGTH = 64;

/**
 * @brief Wrap raw P-256 X||Y coordinates into SubjectPublicKeyInfo DER
 * @return DER bytes, empty if the point is not on the curve
 */
std::vector<uint8_t> rawP256ToDer(const std::vector<uint8_t>& raw) {
    std::vector<uint8_t> point;
    point.reserve(raw.size() + 1);
    point.push_back(0x04);  // uncompressed point
    point.insert(point.end(), raw.begin(), raw.end());

    EC_KEY* ecKey = EC_KEY_new_by_curve_name(NID_X9_62_prime256v1);
    if (!ecKey) return {};

    const unsigned char* p = point.data();
    if (!o2i_ECPublicKey(&ecKey, &p, static_cast<long>(point.size()))) {
        EC_KEY_free(ecKey);
        ERR_clear_error();
        return {};
    }

    EVP_PKEY* pkey = EVP_PKEY_new();
    if (!pkey || EVP_PKEY_assign_EC_KEY(pkey, ecKey) != 1) {
        EVP_PKEY_free(pkey);
        EC_KEY_free(ecKey);
        return {};
    }

    std::vector<uint8_t> der;
    int len = i2d_PUBKEY(pkey, nullptr);
    if (len > 0) {
        der.resize(static_cast<size_t>(len));
        unsigned char* out = der.data();
        i2d_PUBKEY(pkey, &out);
    }
    EVP_PKEY_free(pkey);  // also frees ecKey
    return der;
}

} // namespace

Result<PublicKey> PublicKey::fromString(const std::string& text) {
    std::string keyText = utils::trim(text);

    std::optional<std::vector<uint8_t>> bytes = utils::fromHex(keyText);
    if (!bytes) {
        bytes = utils::fromBase64(keyText);
    }
    if (!bytes || bytes->empty()) {
        return Error(ErrorKind::BASE64_DECODING, "PK",
                     "Invalid public key encoding: not valid hex or base64");
    }

    auto key = fromDer(*bytes);
    if (key || bytes->size() != RAW_P256_KEY_LENGTH) {
        return key;
    }

    spdlog::debug("[PublicKey] DER parsing failed, trying raw secp256r1 coordinates");
    std::vector<uint8_t> der = rawP256ToDer(*bytes);
    if (der.empty()) {
        return Error::wrap(ErrorKind::PUBLIC_KEY,
                           "Failed to parse public key as DER or raw secp256r1 point",
                           key.error());
    }
    return fromDer(der);
}

Result<PublicKey> PublicKey::fromDer(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()));
    if (!pkey) {
        ERR_clear_error();
        return Error(ErrorKind::PUBLIC_KEY, "PK", "Failed to parse public key: invalid DER encoding");
    }

    if (p != der.data() + der.size()) {
        EVP_PKEY_free(pkey);
        return Error(ErrorKind::PUBLIC_KEY, "PK", "Failed to parse public key: trailing data after DER");
    }

    if (EVP_PKEY_base_id(pkey) != EVP_PKEY_EC) {
        EVP_PKEY_free(pkey);
        return Error(ErrorKind::PUBLIC_KEY, "PK", "Public key is not an elliptic curve key");
    }

    const EC_KEY* ecKey = EVP_PKEY_get0_EC_KEY(pkey);
    int nid = ecKey ? EC_GROUP_get_curve_name(EC_KEY_get0_group(ecKey)) : NID_undef;
    int bits = EVP_PKEY_bits(pkey);
    EVP_PKEY_free(pkey);

    auto curve = curveFromNid(nid);
    if (!curve) {
        const char* name = nid != NID_undef ? OBJ_nid2sn(nid) : nullptr;
        return Error(ErrorKind::PUBLIC_KEY, "PK",
                     std::string("Unsupported elliptic curve: ") + (name ? name : "unknown"));
    }

    return PublicKey(der, *curve, bits);
}

std::string PublicKey::toString(bool base64) const {
    return base64 ? utils::toBase64(der_) : utils::toHex(der_);
}

std::string PublicKey::keyTypeIdentifier() const {
    return "ECDSA-" + crypto::toString(curve_);
}

bool PublicKey::matchesSignatureAlgorithm(const std::string& algorithm) const {
    auto method = resolveSignatureAlgorithm(algorithm);
    return method && isSameCurve(method->curve, curve_);
}

EVP_PKEY* PublicKey::toEvpKey() const {
    const unsigned char* p = der_.data();
    EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(der_.size()));
    if (!pkey) {
        ERR_clear_error();
    }
    return pkey;
}

} // namespace ocmf::crypto
