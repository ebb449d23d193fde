// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file defaults.h
 * @brief Compile-time defaults for extraction, patterns and polling
 *
 * Every value here can be overridden at runtime through AppConfig
 * (JSON config file or command-line flags).
 */

#ifndef COVERLIGHT_CONFIG_DEFAULTS_H
#define COVERLIGHT_CONFIG_DEFAULTS_H

#include <cstddef>
#include <cstdint>

namespace coverlight {
namespace config {

namespace ExtractDefaults {
    // Longest side after downscale (pixels)
    constexpr uint16_t MAX_DIMENSION = 200;

    // Adaptive palette size before top-4 selection (median cut, at most 8)
    constexpr uint8_t QUANTIZED_COLOURS = 8;
    constexpr uint8_t MAX_QUANTIZED_COLOURS = 8;

    // Channel value at or above which a colour counts as near-white
    constexpr uint8_t NEAR_WHITE_THRESHOLD = 245;

    constexpr const char* CACHE_DIR = "cache";
}

namespace NetworkDefaults {
    constexpr uint32_t FETCH_TIMEOUT_MS = 15000;
    constexpr uint32_t CONNECT_TIMEOUT_MS = 5000;
    constexpr const char* USER_AGENT = "coverlight/1.0";
}

namespace PatternDefaults {
    constexpr size_t LENGTH = 16;
    // Input limit for --length and pattern_length; PatternGenerator itself
    // accepts any length
    constexpr size_t MAX_LENGTH = 4096;
    constexpr const char* MODE = "repeat";
}

namespace PollDefaults {
    constexpr uint32_t INTERVAL_SEC = 60;
    constexpr uint32_t MAX_LOOPS = 0;  // 0 = unlimited
    constexpr const char* SNAPSHOT_FILE = "current_palette.json";
}

} // namespace config
} // namespace coverlight

#endif // COVERLIGHT_CONFIG_DEFAULTS_H
