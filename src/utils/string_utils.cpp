/**
 * @file string_utils.cpp
 * @brief String and encoding utility implementation
 */

#include "ocmf/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <openssl/evp.h>

namespace ocmf::utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::vector<std::string> splitN(const std::string& str, char delimiter, size_t maxParts) {
    std::vector<std::string> parts;
    size_t start = 0;

    while (maxParts == 0 || parts.size() + 1 < maxParts) {
        size_t pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(str.substr(start));

    return parts;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::string toHex(const std::vector<uint8_t>& data, bool lowercase) {
    const char* hexChars = lowercase ? "0123456789abcdef" : "0123456789ABCDEF";
    std::string result;
    result.reserve(data.size() * 2);

    for (uint8_t byte : data) {
        result.push_back(hexChars[(byte >> 4) & 0x0F]);
        result.push_back(hexChars[byte & 0x0F]);
    }

    return result;
}

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isBase64Char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

} // namespace

std::optional<std::vector<uint8_t>> fromHex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    return bytes;
}

bool isHexString(const std::string& str) {
    return !str.empty() &&
           std::all_of(str.begin(), str.end(), [](char c) { return hexValue(c) >= 0; });
}

std::string toBase64(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    std::string result(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                                  data.data(), static_cast<int>(data.size()));
    result.resize(static_cast<size_t>(written));
    return result;
}

std::optional<std::vector<uint8_t>> fromBase64(const std::string& base64) {
    if (base64.empty()) {
        return std::vector<uint8_t>{};
    }
    if (base64.length() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    if (base64.back() == '=') padding++;
    if (base64.length() >= 2 && base64[base64.length() - 2] == '=') padding++;

    for (size_t i = 0; i < base64.length() - padding; ++i) {
        if (!isBase64Char(base64[i])) {
            return std::nullopt;
        }
    }

    std::vector<uint8_t> result(base64.length() / 4 * 3);
    int decoded = EVP_DecodeBlock(result.data(),
                                  reinterpret_cast<const unsigned char*>(base64.data()),
                                  static_cast<int>(base64.length()));
    if (decoded < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding bytes as decoded zeros
    result.resize(static_cast<size_t>(decoded) - padding);
    return result;
}

bool isValidUtf8(const std::string& str) {
    size_t i = 0;
    const size_t len = str.length();

    while (i < len) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        size_t extra = 0;
        uint32_t codepoint = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            codepoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            codepoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            codepoint = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= len) {
            return false;
        }
        for (size_t j = 1; j <= extra; ++j) {
            unsigned char cc = static_cast<unsigned char>(str[i + j]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            codepoint = (codepoint << 6) | (cc & 0x3F);
        }

        // Reject overlong encodings, surrogates and out-of-range code points
        if ((extra == 1 && codepoint < 0x80) ||
            (extra == 2 && codepoint < 0x800) ||
            (extra == 3 && codepoint < 0x10000) ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF) ||
            codepoint > 0x10FFFF) {
            return false;
        }

        i += extra + 1;
    }

    return true;
}

std::string formatDecimal(double value) {
    char buffer[32];
    if (std::isfinite(value) && std::fabs(value) < 1e15 && value == std::trunc(value)) {
        std::snprintf(buffer, sizeof(buffer), "%.1f", value);
        return buffer;
    }

    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }

    std::string result(buffer);
    if (result.find_first_of(".eEn") == std::string::npos) {
        result += ".0";
    }
    return result;
}

} // namespace ocmf::utils
