/**
 * @file obis_registry.cpp
 * @brief OBIS registry table and classification
 */

#include "ocmf/obis/obis_registry.h"
#include <map>
#include <regex>

namespace ocmf::obis {

namespace {

const std::regex& accumulationPattern() {
    static const std::regex pattern(R"(^01-00:[BC][0-3]\.08\.00$)");
    return pattern;
}

const std::regex& transactionPattern() {
    static const std::regex pattern(R"(^01-00:[BC][23]\.08\.00$)");
    return pattern;
}

const std::regex& iecEnergyPattern() {
    static const std::regex pattern(R"(^01-00:0[12]\.08\.00$)");
    return pattern;
}

const std::map<std::string, ObisInfo>& knownCodes() {
    static const std::map<std::string, ObisInfo> table = [] {
        std::map<std::string, ObisInfo> t;
        auto add = [&t](const std::string& code, const std::string& description,
                        bool billing, ObisCategory category) {
            t[code] = ObisInfo{code, description, billing, category};
        };

        // OCMF Table 25: reserved accumulation registers
        add("01-00:B0.08.00", "Total Import Mains Energy (energy at meter)", true, ObisCategory::IMPORT);
        add("01-00:B1.08.00", "Total Import Device Energy (energy at device/car)", true, ObisCategory::IMPORT);
        add("01-00:B2.08.00", "Transaction Import Mains Energy (session energy at meter)", true, ObisCategory::IMPORT);
        add("01-00:B3.08.00", "Transaction Import Device Energy (session energy at device)", true, ObisCategory::IMPORT);
        add("01-00:C0.08.00", "Total Export Mains Energy", true, ObisCategory::EXPORT);
        add("01-00:C1.08.00", "Total Export Device Energy", true, ObisCategory::EXPORT);
        add("01-00:C2.08.00", "Transaction Export Mains Energy", true, ObisCategory::EXPORT);
        add("01-00:C3.08.00", "Transaction Export Device Energy", true, ObisCategory::EXPORT);

        // Common IEC registers
        add("01-00:00.08.06", "Charging duration (time-based)", false, ObisCategory::OTHER);
        add("01-00:01.08.00", "Active energy import (+A) total", true, ObisCategory::IMPORT);
        add("01-00:02.08.00", "Active energy export (-A) total", true, ObisCategory::EXPORT);
        add("01-00:16.07.00", "Sum active power (total)", false, ObisCategory::POWER);

        // Legacy notation used by older meters
        add("1-b:1.8.0", "Active energy import (+A) - legacy format", true, ObisCategory::IMPORT);
        add("1-b:2.8.0", "Active energy export (-A) - legacy format", true, ObisCategory::EXPORT);
        return t;
    }();
    return table;
}

} // namespace

std::string normalize(const std::string& code) {
    return code.substr(0, code.find('*'));
}

std::optional<ObisInfo> lookup(const std::string& code) {
    const auto& table = knownCodes();
    auto it = table.find(normalize(code));
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool isAccumulationRegister(const std::string& code) {
    return std::regex_match(normalize(code), accumulationPattern());
}

bool isTransactionRegister(const std::string& code) {
    return std::regex_match(normalize(code), transactionPattern());
}

bool isBillingRelevant(const std::string& code) {
    std::string normalized = normalize(code);

    if (auto info = lookup(normalized)) {
        return info->billingRelevant;
    }

    return std::regex_match(normalized, accumulationPattern()) ||
           std::regex_match(normalized, iecEnergyPattern());
}

BillingCheckResult validateObisForBilling(const std::optional<std::string>& code) {
    BillingCheckResult result;

    if (!code) {
        result.message = "OBIS code (RI) is required for billing-relevant readings";
        return result;
    }

    if (!isBillingRelevant(*code)) {
        result.message = "OBIS code '" + normalize(*code) + "' is not billing-relevant";
        return result;
    }

    result.valid = true;
    return result;
}

} // namespace ocmf::obis
