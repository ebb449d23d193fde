// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DebugConfig.h
 * @brief Unified debug configuration system for CoverLight
 *
 * Provides a single configuration struct for controlling debug verbosity
 * across all domains (extract, pattern, network, system).
 *
 * Levels:
 *   0 = OFF      - No debug output
 *   1 = ERROR    - Actual errors (fetch failed, undecodable image)
 *   2 = WARN     - Errors + actionable warnings (default)
 *   3 = INFO     - Warn + significant events
 *   4 = VERBOSE  - Info + diagnostic values
 *   5 = TRACE    - Everything (per-entry quantization, per-poll state)
 *
 * Command line:
 *   --log-level <0-5>               - Set global level
 *   --log-domain extract=<0-5>      - Set extract domain level
 *   --log-domain pattern=<0-5>      - Set pattern domain level
 *   --log-domain network=<0-5>      - Set network domain level
 *   --log-domain system=<0-5>       - Set system domain level
 */

#pragma once

#include <cstdint>

namespace coverlight {
namespace config {

/**
 * @brief Debug domains for per-domain verbosity control
 */
enum class DebugDomain : uint8_t {
    EXTRACT = 0,
    PATTERN = 1,
    NETWORK = 2,
    SYSTEM = 3,
    _COUNT = 4
};

/**
 * @brief Debug levels with clear semantics
 *
 * NOTE: We use VERBOSE instead of DEBUG to avoid collisions with
 * a DEBUG macro defined by build flags.
 */
enum class DebugLevel : uint8_t {
    OFF = 0,      ///< Nothing from this domain
    ERROR = 1,    ///< Actual failures
    WARN = 2,     ///< Errors + actionable warnings
    INFO = 3,     ///< Warn + significant events (new artwork, extraction done)
    VERBOSE = 4,  ///< Info + diagnostic values (image size, entry counts)
    TRACE = 5     ///< Everything
};

/**
 * @brief Domain name strings for parsing and printing
 */
constexpr const char* DEBUG_DOMAIN_NAMES[] = {
    "extract",
    "pattern",
    "network",
    "system"
};

/**
 * @brief Unified debug configuration
 */
struct DebugConfig {
    /// Global verbosity level (affects all domains unless overridden)
    uint8_t globalLevel = static_cast<uint8_t>(DebugLevel::WARN);

    /// Domain-specific overrides (-1 = use global level)
    int8_t extractLevel = -1;
    int8_t patternLevel = -1;
    int8_t networkLevel = -1;
    int8_t systemLevel = -1;

    /**
     * @brief Get effective level for a domain
     * @param domain The debug domain
     * @return Effective level (domain override or global)
     */
    uint8_t effectiveLevel(DebugDomain domain) const {
        int8_t domainLevel = getDomainLevel(domain);
        return (domainLevel >= 0) ? static_cast<uint8_t>(domainLevel) : globalLevel;
    }

    /**
     * @brief Set domain-specific level
     * @param domain The debug domain
     * @param level Level to set (-1 to use global)
     */
    void setDomainLevel(DebugDomain domain, int8_t level) {
        switch (domain) {
            case DebugDomain::EXTRACT: extractLevel = level; break;
            case DebugDomain::PATTERN: patternLevel = level; break;
            case DebugDomain::NETWORK: networkLevel = level; break;
            case DebugDomain::SYSTEM:  systemLevel = level; break;
            default: break;
        }
    }

    /**
     * @brief Get raw domain level setting
     * @return Raw level (-1 if using global)
     */
    int8_t getDomainLevel(DebugDomain domain) const {
        switch (domain) {
            case DebugDomain::EXTRACT: return extractLevel;
            case DebugDomain::PATTERN: return patternLevel;
            case DebugDomain::NETWORK: return networkLevel;
            case DebugDomain::SYSTEM:  return systemLevel;
            default: return -1;
        }
    }

    bool shouldLog(DebugDomain domain, DebugLevel level) const {
        return effectiveLevel(domain) >= static_cast<uint8_t>(level);
    }

    static const char* domainName(DebugDomain domain);

    static const char* levelName(DebugLevel level);

    /**
     * @brief Get level name as string (overload for raw uint8_t)
     * @param level The level as uint8_t (0-5)
     */
    static const char* levelName(uint8_t level);

    /**
     * @brief Look up a domain by its lowercase name
     * @param name Domain name ("extract", "pattern", "network", "system")
     * @param out Receives the domain on success
     * @return true if the name is a known domain
     */
    static bool parseDomain(const char* name, DebugDomain& out);
};

/**
 * @brief Get the global debug configuration singleton
 */
DebugConfig& getDebugConfig();

/**
 * @brief Reset debug configuration to defaults
 */
void resetDebugConfig();

/**
 * @brief Print current debug configuration to stderr
 */
void printDebugConfig();

} // namespace config
} // namespace coverlight
