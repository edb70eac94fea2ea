/**
 * @file obis_registry.h
 * @brief OBIS register classification (IEC 62056-6-1, OCMF Table 25)
 *
 * Pure functions over a static, read-only table. Safe to call from any thread.
 */

#pragma once

#include <optional>
#include <string>

namespace ocmf::obis {

/// @brief Measurement category of an OBIS register
enum class ObisCategory {
    IMPORT,
    EXPORT,
    POWER,
    OTHER
};

inline std::string toString(ObisCategory category) {
    switch (category) {
        case ObisCategory::IMPORT: return "import";
        case ObisCategory::EXPORT: return "export";
        case ObisCategory::POWER:  return "power";
        case ObisCategory::OTHER:  return "other";
    }
    return "other";
}

/**
 * @brief Registry entry for a known OBIS code
 */
struct ObisInfo {
    std::string code;          ///< Normalized code (no "*" suffix)
    std::string description;
    bool billingRelevant = false;
    ObisCategory category = ObisCategory::OTHER;
};

/**
 * @brief Strip the "*suffix" part of an OBIS code
 *
 * "01-00:B0.08.00*FF" -> "01-00:B0.08.00", "1-b:1.8.0" -> "1-b:1.8.0"
 */
std::string normalize(const std::string& code);

/**
 * @brief Look up a code in the registry (suffix is ignored)
 * @return Registry entry, or std::nullopt for unknown codes
 */
std::optional<ObisInfo> lookup(const std::string& code);

/**
 * @brief Accumulation registers B0-B3 and C0-C3 (01-00:[BC][0-3].08.00)
 */
bool isAccumulationRegister(const std::string& code);

/**
 * @brief Session-scoped registers B2, B3, C2, C3
 *
 * B0, B1, C0, C1 count over the life of the device and are not transaction
 * registers.
 */
bool isTransactionRegister(const std::string& code);

/**
 * @brief Billing relevance: table lookup, then pattern fallback
 *
 * Unknown codes are billing-relevant if they look like an accumulation
 * register or a standard IEC energy register (01-00:0[12].08.00).
 */
bool isBillingRelevant(const std::string& code);

/**
 * @brief Result of validateObisForBilling()
 */
struct BillingCheckResult {
    bool valid = false;
    std::string message;  ///< Empty when valid
};

/**
 * @brief Check that a reading's RI is usable for billing
 * @param code OBIS code, std::nullopt if the reading has no RI
 */
BillingCheckResult validateObisForBilling(const std::optional<std::string>& code);

} // namespace ocmf::obis
