// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AppConfig.h
 * @brief Runtime configuration for the coverlight tool
 *
 * Layers, lowest precedence first:
 *   1. Compile-time defaults (defaults.h)
 *   2. JSON config file given with --config (ConfigCodec)
 *   3. Command-line flags
 *
 * Command syntax:
 *   coverlight [global flags] demo
 *   coverlight [global flags] extract <identifier>
 *   coverlight [global flags] pattern <identifier> [--length N] [--mode M]
 *   coverlight [global flags] poll [--input FILE] [--interval S]
 *                                  [--max-loops N] [--snapshot PATH]
 *
 * Global flags: --config FILE, --cache-dir DIR, --timeout MS,
 * --log-level 0-5, --log-domain name=0-5, --swatches
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "defaults.h"
#include "DebugConfig.h"
#include "core/CoverTypes.h"

namespace coverlight {
namespace config {

enum class Command : uint8_t {
    NONE = 0,
    DEMO,
    EXTRACT,
    PATTERN,
    POLL,
    HELP
};

const char* commandName(Command command);

struct DomainLevelOverride {
    DebugDomain domain;
    uint8_t level;
};

struct AppConfig {
    // Extraction
    std::string cacheDir = ExtractDefaults::CACHE_DIR;
    uint16_t maxDimension = ExtractDefaults::MAX_DIMENSION;
    uint8_t quantizedColours = ExtractDefaults::QUANTIZED_COLOURS;
    uint8_t nearWhiteThreshold = ExtractDefaults::NEAR_WHITE_THRESHOLD;

    // Network
    uint32_t fetchTimeoutMs = NetworkDefaults::FETCH_TIMEOUT_MS;

    // Pattern
    size_t patternLength = PatternDefaults::LENGTH;
    std::string patternMode = PatternDefaults::MODE;

    // Poll loop
    uint32_t intervalSec = PollDefaults::INTERVAL_SEC;
    uint32_t maxLoops = PollDefaults::MAX_LOOPS;
    std::string snapshotPath;           ///< Empty = <cacheDir>/current_palette.json
    std::string inputPath;              ///< Empty = stdin

    // Output / logging
    bool swatches = false;
    uint8_t logLevel = static_cast<uint8_t>(DebugLevel::WARN);
    std::vector<DomainLevelOverride> domainLevels;

    /**
     * @brief Snapshot file, resolved against cacheDir when not set
     */
    std::string resolvedSnapshotPath() const;
};

struct CliOptions {
    Command command;
    std::string identifier;             ///< extract / pattern argument
    std::string configPath;             ///< --config, empty when absent
    AppConfig config;

    CliOptions() : command(Command::NONE) {}
};

struct ConfigLoadResult {
    bool success;
    char errorMsg[MAX_ERROR_MSG];

    ConfigLoadResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

/**
 * @brief Parse argv into command, identifier and configuration
 *
 * The config file named by --config is loaded before any other flag is
 * applied so that flags always win, wherever they appear on the line.
 *
 * @return Failure for unknown flags, missing values, bad numbers, a missing
 *         command, or an unreadable or invalid config file
 */
ConfigLoadResult parseCommandLine(int argc, char** argv, CliOptions& out);

/**
 * @brief Merge a JSON config file over cfg (layer 2)
 *
 * cfg is left untouched on failure.
 */
ConfigLoadResult loadConfigFile(const char* path, AppConfig& cfg);

/**
 * @brief Push logLevel and domainLevels into the global DebugConfig
 */
void applyLogging(const AppConfig& cfg);

/**
 * @brief Usage text for --help and usage errors
 */
void printUsage(FILE* stream);

} // namespace config
} // namespace coverlight
