// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConfigCodec.h
 * @brief JSON codec for the coverlight config file
 *
 * Single canonical location for config-file keys. Every key is optional;
 * present keys override the matching AppConfig field.
 *
 * @code
 * {
 *   "cache_dir": "cache",
 *   "snapshot_path": "cache/current_palette.json",
 *   "interval_sec": 60,
 *   "max_loops": 0,
 *   "pattern_length": 16,          (0-4096)
 *   "pattern_mode": "repeat",
 *   "fetch_timeout_ms": 15000,
 *   "max_dimension": 200,
 *   "quantized_colours": 8,        (1-8)
 *   "near_white_threshold": 245,
 *   "log_level": 2,
 *   "swatches": false
 * }
 * @endcode
 */

#pragma once

#include <ArduinoJson.h>
#include <stdint.h>
#include <cstddef>
#include <cstring>

#include "config/AppConfig.h"

namespace coverlight {
namespace codec {

struct ConfigDecodeResult {
    bool success;
    config::AppConfig config;           ///< Input merged with the file's keys
    char errorMsg[MAX_ERROR_MSG];

    ConfigDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

/**
 * @brief Config file codec
 *
 * Enforces type checking with is<T>(), range validation, known pattern
 * modes, and unknown-key rejection.
 */
class ConfigCodec {
public:
    /**
     * @brief Overlay root onto base
     * @param root Parsed config document
     * @param base Configuration the file's keys are applied to
     */
    static ConfigDecodeResult decode(JsonObjectConst root, const config::AppConfig& base);

    /**
     * @brief Write every file-backed field of cfg
     */
    static void encode(const config::AppConfig& cfg, JsonObject& obj);
};

} // namespace codec
} // namespace coverlight
