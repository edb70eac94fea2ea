/**
 * @file obis_code.h
 * @brief OBIS code value type
 */

#pragma once

#include "ocmf/common/error.h"
#include "ocmf/obis/obis_registry.h"
#include <optional>
#include <string>

namespace ocmf::obis {

/**
 * @brief Parsed OBIS code (e.g. "01-00:B2.08.00*FF")
 *
 * Accepts the strict OCMF notation (six zero-padded uppercase hex groups with
 * "*" suffix) and the flexible IEC 62056 notation ("1-b:1.8.0",
 * "1-0:1.8.0*198"). The code part and the suffix are kept separately so that
 * toString() reproduces the input exactly.
 */
class ObisCode {
public:
    /**
     * @brief Parse and validate an OBIS code
     * @param text Code text as found in the RI field
     * @return ObisCode, or VALIDATION error naming field "RI"
     */
    static Result<ObisCode> parse(const std::string& text);

    /// @brief Normalized code without suffix
    const std::string& code() const { return code_; }

    /// @brief Suffix after "*", if any
    const std::optional<std::string>& suffix() const { return suffix_; }

    std::string toString() const;

    std::optional<ObisInfo> info() const { return lookup(code_); }
    bool isBillingRelevant() const { return obis::isBillingRelevant(code_); }
    bool isAccumulationRegister() const { return obis::isAccumulationRegister(code_); }
    bool isTransactionRegister() const { return obis::isTransactionRegister(code_); }

    bool operator==(const ObisCode& other) const {
        return code_ == other.code_ && suffix_ == other.suffix_;
    }
    bool operator!=(const ObisCode& other) const { return !(*this == other); }

private:
    ObisCode(std::string code, std::optional<std::string> suffix)
        : code_(std::move(code)), suffix_(std::move(suffix)) {}

    std::string code_;
    std::optional<std::string> suffix_;
};

} // namespace ocmf::obis
