/**
 * @file ocmf_codec.cpp
 * @brief OCMF wire codec implementation
 */

#include "ocmf/codec/ocmf_codec.h"
#include "ocmf/codec/json_mapping.h"
#include "ocmf/utils/string_utils.h"
#include <spdlog/spdlog.h>

namespace ocmf::codec {

namespace {

Result<std::string> decodeHexInput(const std::string& text) {
    auto bytes = utils::fromHex(text);
    if (!bytes) {
        return Error(ErrorKind::HEX_DECODING, "",
                     std::string("Invalid OCMF string: must start with '") + PREFIX +
                     "' or be valid hex-encoded");
    }

    std::string decoded(bytes->begin(), bytes->end());
    if (!utils::isValidUtf8(decoded)) {
        return Error(ErrorKind::HEX_DECODING, "",
                     "Hex-encoded OCMF string does not decode to valid UTF-8");
    }
    return decoded;
}

Result<model::Payload> parsePayload(const std::string& text, const model::ValidationOptions& options) {
    auto json = parseJsonObject(text);
    if (!json) {
        return json.error();
    }

    auto payload = payloadFromJson(json.value());
    if (!payload) {
        return payload.error();
    }

    if (auto err = model::validatePayload(payload.value(), options)) {
        return *err;
    }
    return payload;
}

Result<model::Signature> parseSignature(const std::string& text) {
    auto json = parseJsonObject(text);
    if (!json) {
        return json.error();
    }

    auto signature = signatureFromJson(json.value());
    if (!signature) {
        return signature.error();
    }

    if (auto err = model::validateSignature(signature.value())) {
        return *err;
    }
    return signature;
}

} // namespace

Result<model::OcmfRecord> parse(const std::string& input, const model::ValidationOptions& options) {
    std::string text = utils::trim(input);

    if (!utils::startsWith(text, PREFIX)) {
        auto decoded = decodeHexInput(text);
        if (!decoded) {
            spdlog::debug("[OcmfCodec] Hex decoding failed: {}", decoded.error().message);
            return decoded.error();
        }
        text = std::move(decoded).value();
    }

    auto parts = utils::splitN(text, SEPARATOR, 3);
    if (parts.size() != 3 || parts[0] != model::OcmfRecord::HEADER) {
        return Error(ErrorKind::FORMAT, "",
                     "String does not match expected OCMF format 'OCMF|{payload}|{signature}'");
    }

    auto payload = parsePayload(parts[1], options);
    if (!payload) {
        spdlog::debug("[OcmfCodec] Payload rejected: {}", payload.error().toString());
        return Error::wrap(ErrorKind::PAYLOAD,
                           "Invalid payload: " + payload.error().message, payload.error());
    }

    auto signature = parseSignature(parts[2]);
    if (!signature) {
        spdlog::debug("[OcmfCodec] Signature rejected: {}", signature.error().toString());
        return Error::wrap(ErrorKind::SIGNATURE,
                           "Invalid signature: " + signature.error().message, signature.error());
    }

    spdlog::debug("[OcmfCodec] Parsed OCMF record: PG={}, {} reading(s)",
                  payload.value().pagination.toString(), payload.value().readings.size());

    return model::OcmfRecord(std::move(payload).value(), std::move(signature).value(),
                             std::move(parts[1]));
}

std::string serialize(const model::OcmfRecord& record, bool hex) {
    std::string text = std::string(model::OcmfRecord::HEADER) + SEPARATOR +
                       writeCompactJson(payloadToJson(record.payload())) + SEPARATOR +
                       writeCompactJson(signatureToJson(record.signature()));

    if (hex) {
        return utils::toHex(std::vector<uint8_t>(text.begin(), text.end()));
    }
    return text;
}

} // namespace ocmf::codec
