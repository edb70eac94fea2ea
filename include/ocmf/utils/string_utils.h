/**
 * @file string_utils.h
 * @brief String and encoding utilities
 *
 * Common string operations and hex/base64 codecs used by the OCMF codec
 * and the signature verifier.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ocmf::utils {

/**
 * @brief Convert string to lowercase (ASCII)
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Split string on delimiter into at most maxParts parts
 *
 * The last part keeps any remaining delimiters, so
 * splitN("a|b|c|d", '|', 3) yields ["a", "b", "c|d"].
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @param maxParts Maximum number of parts (0 = unlimited)
 * @return Vector of string parts (never empty)
 */
std::vector<std::string> splitN(const std::string& str, char delimiter, size_t maxParts = 0);

/**
 * @brief Check if string starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Convert binary data to hex string
 *
 * @param data Binary data
 * @param lowercase true for lowercase hex, false for uppercase
 * @return Hex string (2 chars per byte)
 */
std::string toHex(const std::vector<uint8_t>& data, bool lowercase = true);

/**
 * @brief Convert hex string to binary data
 *
 * Case-insensitive. Empty input decodes to an empty vector.
 *
 * @param hex Hex string (must be even length)
 * @return Binary data, or std::nullopt on odd length or non-hex characters
 */
std::optional<std::vector<uint8_t>> fromHex(const std::string& hex);

/**
 * @brief Check that a string is non-empty and contains only hex digits
 */
bool isHexString(const std::string& str);

/**
 * @brief Encode binary data to Base64 (standard alphabet, padded, no newlines)
 */
std::string toBase64(const std::vector<uint8_t>& data);

/**
 * @brief Decode Base64 string
 *
 * Strict: only the standard alphabet, length a multiple of 4 and at most two
 * trailing '=' padding characters are accepted.
 *
 * @param base64 Base64-encoded string
 * @return Binary data, or std::nullopt on error
 */
std::optional<std::vector<uint8_t>> fromBase64(const std::string& base64);

/**
 * @brief Check if string is valid UTF-8
 */
bool isValidUtf8(const std::string& str);

/**
 * @brief Format a double as the shortest decimal text that reads back exactly
 *
 * Integral values keep a trailing ".0" (e.g. 1.0 -> "1.0", 0.2596 -> "0.2596").
 */
std::string formatDecimal(double value);

} // namespace ocmf::utils
