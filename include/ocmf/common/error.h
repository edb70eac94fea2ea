/**
 * @file error.h
 * @brief Error taxonomy and Result type for OCMF operations
 *
 * Parse, validate and verify operations return a Result instead of throwing.
 * Every error carries its kind, the offending field and an optional nested
 * cause so callers can render a precise diagnostic.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace ocmf {

/// @brief Error kinds
enum class ErrorKind {
    FORMAT,           ///< Malformed OCMF|payload|signature structure
    HEX_DECODING,     ///< Hex string could not be decoded
    BASE64_DECODING,  ///< Base64 string could not be decoded
    PAYLOAD,          ///< Payload section failed to parse or validate
    SIGNATURE,        ///< Signature section failed to parse or validate
    VALIDATION,       ///< Field or cross-field invariant violated
    PUBLIC_KEY,       ///< Key material unparseable or not an EC key
    VERIFICATION      ///< Algorithm unsupported/mismatched or verification not attempted
};

/// @brief Convert ErrorKind to string
inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FORMAT:          return "FORMAT_ERROR";
        case ErrorKind::HEX_DECODING:    return "HEX_DECODING_ERROR";
        case ErrorKind::BASE64_DECODING: return "BASE64_DECODING_ERROR";
        case ErrorKind::PAYLOAD:         return "PAYLOAD_ERROR";
        case ErrorKind::SIGNATURE:       return "SIGNATURE_ERROR";
        case ErrorKind::VALIDATION:      return "VALIDATION_ERROR";
        case ErrorKind::PUBLIC_KEY:      return "PUBLIC_KEY_ERROR";
        case ErrorKind::VERIFICATION:    return "SIGNATURE_VERIFICATION_ERROR";
    }
    return "UNKNOWN";
}

/// @brief Hex and base64 failures are both encoding errors
inline bool isEncodingError(ErrorKind kind) {
    return kind == ErrorKind::HEX_DECODING || kind == ErrorKind::BASE64_DECODING;
}

/**
 * @brief Structured error with optional nested cause
 */
struct Error {
    ErrorKind kind = ErrorKind::VALIDATION;
    std::string field;    ///< Offending field (e.g. "RD[1].CL"), empty if not field-specific
    std::string message;  ///< Human-readable description
    std::shared_ptr<const Error> cause;

    Error() = default;
    Error(ErrorKind k, std::string f, std::string m)
        : kind(k), field(std::move(f)), message(std::move(m)) {}

    /// @brief Wrap an underlying error, inheriting its field
    static Error wrap(ErrorKind kind, const std::string& message, const Error& inner) {
        Error e(kind, inner.field, message);
        e.cause = std::make_shared<const Error>(inner);
        return e;
    }

    /// @brief Innermost error in the cause chain
    const Error& rootCause() const {
        const Error* e = this;
        while (e->cause) e = e->cause.get();
        return *e;
    }

    std::string toString() const {
        std::string result = errorKindToString(kind);
        if (!field.empty()) result += " [" + field + "]";
        result += ": " + message;
        if (cause) result += " (caused by: " + cause->toString() + ")";
        return result;
    }
};

/**
 * @brief Value-or-error result
 *
 * Holds exactly one of a value of type T or an Error.
 */
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    static Result ok(T value) { return Result(std::move(value)); }
    static Result fail(Error error) { return Result(std::move(error)); }

    bool isOk() const { return value_.has_value(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const& { return *value_; }
    T& value() & { return *value_; }
    T&& value() && { return std::move(*value_); }

    const Error& error() const { return *error_; }

private:
    std::optional<T> value_;
    std::optional<Error> error_;
};

/// @brief Result of an operation without a value: empty on success
using Status = std::optional<Error>;

} // namespace ocmf
