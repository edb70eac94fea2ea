/**
 * @file obis_code.cpp
 * @brief OBIS code parsing
 */

#include "ocmf/obis/obis_code.h"
#include <regex>

namespace ocmf::obis {

namespace {

// OCMF notation: 01-0B:01.08.00*FF
const std::regex& strictPattern() {
    static const std::regex pattern(
        R"(^[0-9A-F]{2}-[0-9A-F]{2}:[0-9A-F]{2}\.[0-9A-F]{2}\.[0-9A-F]{2}\*[0-9A-F]{2}$)");
    return pattern;
}

// IEC 62056-6-1: 1-b:1.8.0, 1-0:1.8.0*198
const std::regex& iecPattern() {
    static const std::regex pattern(
        R"(^[0-9A-Fa-f]{1,2}-[0-9A-Fa-f]{1,2}:[0-9A-Fa-f]{1,2}\.[0-9A-Fa-f]{1,2}\.[0-9A-Fa-f]{1,2}(\*[0-9A-Fa-f]{1,3})?$)");
    return pattern;
}

} // namespace

Result<ObisCode> ObisCode::parse(const std::string& text) {
    if (!std::regex_match(text, strictPattern()) && !std::regex_match(text, iecPattern())) {
        return Error(ErrorKind::VALIDATION, "RI",
                     "RI '" + text + "' is not a valid OBIS code");
    }

    size_t star = text.find('*');
    if (star == std::string::npos) {
        return ObisCode(text, std::nullopt);
    }
    return ObisCode(text.substr(0, star), text.substr(star + 1));
}

std::string ObisCode::toString() const {
    return suffix_ ? code_ + "*" + *suffix_ : code_;
}

} // namespace ocmf::obis
