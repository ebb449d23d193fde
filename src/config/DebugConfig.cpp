// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DebugConfig.cpp
 * @brief Unified debug configuration implementation
 */

#include "DebugConfig.h"

#include <cstdio>
#include <cstring>

#define DBG_PRINTF(...) std::fprintf(stderr, __VA_ARGS__)

namespace coverlight {
namespace config {

namespace {
    /// Singleton instance
    DebugConfig s_debugConfig;
}

// ============================================================================
// Singleton Access
// ============================================================================

DebugConfig& getDebugConfig() {
    return s_debugConfig;
}

void resetDebugConfig() {
    s_debugConfig = DebugConfig();
}

// ============================================================================
// Static Name Methods
// ============================================================================

const char* DebugConfig::domainName(DebugDomain domain) {
    switch (domain) {
        case DebugDomain::EXTRACT: return "EXTRACT";
        case DebugDomain::PATTERN: return "PATTERN";
        case DebugDomain::NETWORK: return "NETWORK";
        case DebugDomain::SYSTEM:  return "SYSTEM";
        default:                   return "UNKNOWN";
    }
}

const char* DebugConfig::levelName(DebugLevel level) {
    return levelName(static_cast<uint8_t>(level));
}

const char* DebugConfig::levelName(uint8_t level) {
    switch (level) {
        case 0:  return "OFF";
        case 1:  return "ERROR";
        case 2:  return "WARN";
        case 3:  return "INFO";
        case 4:  return "VERBOSE";
        case 5:  return "TRACE";
        default: return "INVALID";
    }
}

bool DebugConfig::parseDomain(const char* name, DebugDomain& out) {
    if (name == nullptr) {
        return false;
    }
    for (uint8_t i = 0; i < static_cast<uint8_t>(DebugDomain::_COUNT); ++i) {
        if (strcmp(name, DEBUG_DOMAIN_NAMES[i]) == 0) {
            out = static_cast<DebugDomain>(i);
            return true;
        }
    }
    return false;
}

// ============================================================================
// Configuration Printing
// ============================================================================

void printDebugConfig() {
    auto& cfg = getDebugConfig();

    DBG_PRINTF("\n=== Debug Configuration ===\n");
    DBG_PRINTF("Global Level: %u (%s)\n", cfg.globalLevel, DebugConfig::levelName(cfg.globalLevel));
    DBG_PRINTF("\nDomain Levels:\n");

    for (uint8_t i = 0; i < static_cast<uint8_t>(DebugDomain::_COUNT); ++i) {
        DebugDomain domain = static_cast<DebugDomain>(i);
        int8_t rawLevel = cfg.getDomainLevel(domain);
        uint8_t effectiveLevel = cfg.effectiveLevel(domain);

        DBG_PRINTF("  %-8s: %u (%s) [%s]\n",
                   DebugConfig::domainName(domain),
                   effectiveLevel,
                   DebugConfig::levelName(effectiveLevel),
                   rawLevel >= 0 ? "override" : "global");
    }
    DBG_PRINTF("===========================\n\n");
}

} // namespace config
} // namespace coverlight
