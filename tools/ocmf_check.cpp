/**
 * @file ocmf_check.cpp
 * @brief Command-line check of an OCMF record
 *
 * Parses an OCMF string (plain or hex), optionally verifies its signature
 * and checks Eichrecht compliance, alone or as a transaction pair.
 *
 * Usage:
 *   ./ocmf-check [--public-key KEY] [--pair OCMF2] [--errors-only] [--hex] [--verbose] OCMF
 *
 * Exit code 0 if everything passed, 1 on any parse, signature or
 * compliance error.
 */

#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "ocmf/common/config_manager.h"
#include "ocmf/common/logger.h"
#include "ocmf/ocmf.h"

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] OCMF\n";
    std::cout << "  --public-key KEY  Verify the signature with KEY (hex or base64 DER)\n";
    std::cout << "  --pair OCMF2      Check OCMF (begin) and OCMF2 (end) as a transaction\n";
    std::cout << "  --errors-only     Do not report compliance warnings\n";
    std::cout << "  --hex             Print the record re-encoded as hex\n";
    std::cout << "  --verbose         Enable debug logging\n";
}

void printRecord(const ocmf::model::OcmfRecord& record, const std::string& label) {
    const auto& payload = record.payload();
    std::cout << label << ": PG=" << payload.pagination.toString()
              << ", serial=" << payload.serialNumber().value_or("-")
              << ", readings=" << payload.readings.size()
              << ", SA=" << record.signature().effectiveAlgorithm() << "\n";

    for (size_t i = 0; i < payload.readings.size(); ++i) {
        const auto& reading = payload.readings[i];
        std::cout << "  RD[" << i << "] " << reading.time.toString()
                  << " TX=" << (reading.reason ? ocmf::model::toString(*reading.reason) : "-")
                  << " RV=" << (reading.value ? std::to_string(*reading.value) : "-")
                  << " " << (reading.unit ? ocmf::model::toString(*reading.unit) : "")
                  << " ST=" << ocmf::model::toString(reading.status) << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto& config = ocmf::common::ConfigManager::getInstance();

    std::optional<std::string> publicKey;
    std::optional<std::string> pairInput;
    std::string input;
    bool errorsOnly = false;
    bool printHex = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--public-key" && i + 1 < argc) {
            publicKey = argv[++i];
        } else if (arg == "--pair" && i + 1 < argc) {
            pairInput = argv[++i];
        } else if (arg == "--errors-only") {
            errorsOnly = true;
        } else if (arg == "--hex") {
            printHex = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            input = arg;
        }
    }

    if (input.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::string logFile = config.getString(ocmf::common::ConfigManager::LOG_FILE);
    ocmf::common::Logger::initialize(
        "ocmf-check",
        verbose ? "debug" : config.getString(ocmf::common::ConfigManager::LOG_LEVEL, "info"),
        !logFile.empty(),
        logFile);

    auto options = ocmf::model::ValidationOptions::fromConfig();
    auto policy = ocmf::eichrecht::CompliancePolicy::fromConfig();
    bool failed = false;

    auto record = ocmf::codec::parse(input, options);
    if (!record) {
        spdlog::error("Failed to parse OCMF: {}", record.error().toString());
        std::cout << "INVALID: " << record.error().toString() << "\n";
        return 1;
    }
    printRecord(record.value(), "OCMF");

    std::optional<ocmf::model::OcmfRecord> pair;
    if (pairInput) {
        auto parsed = ocmf::codec::parse(*pairInput, options);
        if (!parsed) {
            spdlog::error("Failed to parse paired OCMF: {}", parsed.error().toString());
            std::cout << "INVALID (pair): " << parsed.error().toString() << "\n";
            return 1;
        }
        pair = std::move(parsed).value();
        printRecord(*pair, "Pair");
    }

    if (printHex) {
        std::cout << "Hex: " << ocmf::codec::serialize(record.value(), true) << "\n";
    }

    // Signature
    if (publicKey || record.value().signature().publicKey) {
        auto valid = ocmf::verifySignature(record.value(), publicKey.value_or(""));
        if (!valid) {
            std::cout << "Signature: ERROR " << valid.error().toString() << "\n";
            failed = true;
        } else {
            std::cout << "Signature: " << (valid.value() ? "VALID" : "INVALID") << "\n";
            failed = failed || !valid.value();
        }

        if (pair) {
            auto pairValid = ocmf::verifySignature(*pair, publicKey.value_or(""));
            if (!pairValid) {
                std::cout << "Signature (pair): ERROR " << pairValid.error().toString() << "\n";
                failed = true;
            } else {
                std::cout << "Signature (pair): " << (pairValid.value() ? "VALID" : "INVALID") << "\n";
                failed = failed || !pairValid.value();
            }
        }
    } else {
        std::cout << "Signature: not checked (no public key)\n";
    }

    // Compliance
    auto issues = ocmf::checkCompliance(record.value(), pair ? &*pair : nullptr, errorsOnly, policy);
    if (issues.empty()) {
        std::cout << "Eichrecht: compliant\n";
    } else {
        for (const auto& issue : issues) {
            std::cout << "Eichrecht " << ocmf::eichrecht::toString(issue.severity) << ": "
                      << issue.toString() << "\n";
        }
        if (ocmf::eichrecht::hasErrors(issues)) {
            failed = true;
        }
    }

    ocmf::common::Logger::flush();
    return failed ? 1 : 0;
}
