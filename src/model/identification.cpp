/**
 * @file identification.cpp
 * @brief Identification type/flag tables and ID format rules
 */

#include "ocmf/model/identification.h"
#include <algorithm>
#include <regex>
#include <set>
#include <utility>

namespace ocmf::model {

namespace {

struct TypeEntry {
    IdentificationType type;
    const char* name;
};

const TypeEntry kTypes[] = {
    {IdentificationType::NONE, "NONE"},
    {IdentificationType::DENIED, "DENIED"},
    {IdentificationType::UNDEFINED, "UNDEFINED"},
    {IdentificationType::ISO14443, "ISO14443"},
    {IdentificationType::ISO15693, "ISO15693"},
    {IdentificationType::EMAID, "EMAID"},
    {IdentificationType::EVCCID, "EVCCID"},
    {IdentificationType::EVCOID, "EVCOID"},
    {IdentificationType::ISO7812, "ISO7812"},
    {IdentificationType::CARD_TXN_NR, "CARD_TXN_NR"},
    {IdentificationType::CENTRAL, "CENTRAL"},
    {IdentificationType::CENTRAL_1, "CENTRAL_1"},
    {IdentificationType::CENTRAL_2, "CENTRAL_2"},
    {IdentificationType::LOCAL, "LOCAL"},
    {IdentificationType::LOCAL_1, "LOCAL_1"},
    {IdentificationType::LOCAL_2, "LOCAL_2"},
    {IdentificationType::PHONE_NUMBER, "PHONE_NUMBER"},
    {IdentificationType::KEY_CODE, "KEY_CODE"},
};

struct FlagEntry {
    FlagSource source;
    const char* token;
};

// OCMF Tables 13-16
const FlagEntry kFlags[] = {
    {FlagSource::RFID, "RFID_NONE"},
    {FlagSource::RFID, "RFID_PLAIN"},
    {FlagSource::RFID, "RFID_RELATED"},
    {FlagSource::RFID, "RFID_PSK"},
    {FlagSource::OCPP, "OCPP_NONE"},
    {FlagSource::OCPP, "OCPP_RS"},
    {FlagSource::OCPP, "OCPP_AUTH"},
    {FlagSource::OCPP, "OCPP_RS_TLS"},
    {FlagSource::OCPP, "OCPP_AUTH_TLS"},
    {FlagSource::OCPP, "OCPP_CACHE"},
    {FlagSource::OCPP, "OCPP_WHITELIST"},
    {FlagSource::OCPP, "OCPP_CERTIFIED"},
    {FlagSource::ISO15118, "ISO15118_NONE"},
    {FlagSource::ISO15118, "ISO15118_PNC"},
    {FlagSource::PLMN, "PLMN_NONE"},
    {FlagSource::PLMN, "PLMN_RING"},
    {FlagSource::PLMN, "PLMN_SMS"},
};

bool matches(const std::string& value, const char* pattern) {
    return std::regex_match(value, std::regex(pattern));
}

bool isValidPhoneNumber(const std::string& value) {
    std::string compact;
    for (char c : value) {
        if (c == ' ' || c == '-' || c == '(' || c == ')' || c == '/') {
            continue;
        }
        compact.push_back(c);
    }
    return matches(compact, R"(^\+[1-9][0-9]{6,14}$)");
}

bool matchesTypeFormat(IdentificationType type, const std::string& id) {
    switch (type) {
        case IdentificationType::ISO14443:
            return matches(id, R"(^[0-9a-fA-F]{8}$|^[0-9a-fA-F]{14}$)");
        case IdentificationType::ISO15693:
            return matches(id, R"(^[0-9a-fA-F]{16}$)");
        case IdentificationType::EMAID:
            return matches(id, R"(^[A-Za-z0-9]{14,15}$)");
        case IdentificationType::EVCCID:
            return id.size() <= 6;
        case IdentificationType::EVCOID:
            return matches(id, R"(^[A-Z]{2,3}-[A-Z0-9]{2,3}-[0-9]{6}-[0-9]$)");
        case IdentificationType::ISO7812:
            return matches(id, R"(^[0-9]{8,19}$)");
        case IdentificationType::PHONE_NUMBER:
            return isValidPhoneNumber(id);
        default:
            return true;
    }
}

} // namespace

std::string toString(IdentificationType type) {
    for (const auto& entry : kTypes) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "NONE";
}

std::optional<IdentificationType> identificationTypeFromString(const std::string& str) {
    for (const auto& entry : kTypes) {
        if (str == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

bool isNoAssignmentType(IdentificationType type) {
    return type == IdentificationType::NONE ||
           type == IdentificationType::DENIED ||
           type == IdentificationType::UNDEFINED;
}

bool isFormatRestrictedType(IdentificationType type) {
    switch (type) {
        case IdentificationType::ISO14443:
        case IdentificationType::ISO15693:
        case IdentificationType::EMAID:
        case IdentificationType::EVCCID:
        case IdentificationType::EVCOID:
        case IdentificationType::ISO7812:
        case IdentificationType::PHONE_NUMBER:
            return true;
        default:
            return false;
    }
}

Status validateIdentificationData(IdentificationType type, const std::optional<std::string>& id) {
    if (!id || id->empty()) {
        return std::nullopt;
    }

    if (isNoAssignmentType(type)) {
        return Error(ErrorKind::VALIDATION, "ID",
                     "ID must be empty when IT=" + toString(type) + " (no assignment type)");
    }

    if (!matchesTypeFormat(type, *id)) {
        return Error(ErrorKind::VALIDATION, "ID",
                     "ID value '" + *id + "' does not match format for identification type '" +
                     toString(type) + "'");
    }

    return std::nullopt;
}

Result<UserIdentification> UserIdentification::create(IdentificationType type,
                                                      std::optional<std::string> value) {
    if (auto err = validateIdentificationData(type, value)) {
        return *err;
    }
    return UserIdentification{type, std::move(value)};
}

std::string toString(FlagSource source) {
    switch (source) {
        case FlagSource::RFID:     return "RFID";
        case FlagSource::OCPP:     return "OCPP";
        case FlagSource::ISO15118: return "ISO15118";
        case FlagSource::PLMN:     return "PLMN";
    }
    return "";
}

std::optional<IdentificationFlag> IdentificationFlag::parse(const std::string& token) {
    for (const auto& entry : kFlags) {
        if (token == entry.token) {
            return IdentificationFlag{entry.source, token};
        }
    }
    return std::nullopt;
}

bool IdentificationFlag::isNone() const {
    static const std::string suffix = "_NONE";
    return token.size() >= suffix.size() &&
           token.compare(token.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Status validateIdentificationFlags(const std::vector<IdentificationFlag>& flags) {
    if (flags.size() <= 1) {
        return std::nullopt;
    }

    bool allNone = std::all_of(flags.begin(), flags.end(),
                               [](const IdentificationFlag& f) { return f.isNone(); });
    if (allNone) {
        return std::nullopt;
    }

    std::set<std::string> sources;
    for (const auto& flag : flags) {
        sources.insert(toString(flag.source));
    }

    if (sources.size() > 1) {
        std::string found;
        for (const auto& s : sources) {
            if (!found.empty()) found += ", ";
            found += s;
        }
        return Error(ErrorKind::VALIDATION, "IF",
                     "IF (Identification Flags) cannot mix flags from different sources. Found: " + found);
    }

    return std::nullopt;
}

Result<Pagination> Pagination::parse(const std::string& text) {
    static const std::regex pattern(R"(^[TF][1-9][0-9]*$)");

    if (!std::regex_match(text, pattern)) {
        return Error(ErrorKind::VALIDATION, "PG",
                     "PG '" + text + "' must be T<n> or F<n> with n >= 1 and no leading zero");
    }

    Pagination pg;
    pg.context = text[0];
    pg.number = text.substr(1);
    return pg;
}

Pagination Pagination::next() const {
    Pagination result = *this;
    std::string& digits = result.number;

    size_t i = digits.size();
    while (i > 0 && digits[i - 1] == '9') {
        digits[--i] = '0';
    }
    if (i == 0) {
        digits.insert(digits.begin(), '1');
    } else {
        ++digits[i - 1];
    }
    return result;
}

} // namespace ocmf::model
