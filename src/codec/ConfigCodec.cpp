// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConfigCodec.cpp
 * @brief Config file codec implementation
 */

#include "ConfigCodec.h"

#include <cstdio>

#include "pattern/PatternGenerator.h"

namespace coverlight {
namespace codec {

static const char* CONFIG_ALLOWED[] = {
    "cache_dir", "snapshot_path", "interval_sec", "max_loops",
    "pattern_length", "pattern_mode", "fetch_timeout_ms", "max_dimension",
    "quantized_colours", "near_white_threshold", "log_level", "swatches"
};

static const char* findUnknownKey(JsonObjectConst root) {
    const size_t keyCount = sizeof(CONFIG_ALLOWED) / sizeof(CONFIG_ALLOWED[0]);
    for (JsonPairConst pair : root) {
        const char* key = pair.key().c_str();
        bool isAllowed = false;
        for (size_t i = 0; i < keyCount; i++) {
            if (strcmp(key, CONFIG_ALLOWED[i]) == 0) {
                isAllowed = true;
                break;
            }
        }
        if (!isAllowed) {
            return key;
        }
    }
    return nullptr;
}

/**
 * @brief Read an optional integer key within [minValue, maxValue]
 * @return false on wrong type or out of range (errorMsg filled)
 */
static bool readRange(JsonObjectConst root, const char* key, int64_t minValue, int64_t maxValue,
                      bool& present, int64_t& value, char* errorMsg) {
    JsonVariantConst v = root[key];
    present = !v.isNull();
    if (!present) {
        return true;
    }
    if (!v.is<int64_t>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "'%s' must be an integer", key);
        return false;
    }
    value = v.as<int64_t>();
    if (value < minValue || value > maxValue) {
        snprintf(errorMsg, MAX_ERROR_MSG, "%s out of range (%lld-%lld): %lld", key,
                 static_cast<long long>(minValue), static_cast<long long>(maxValue),
                 static_cast<long long>(value));
        return false;
    }
    return true;
}

static bool readString(JsonObjectConst root, const char* key, bool allowEmpty,
                       bool& present, const char*& value, char* errorMsg) {
    JsonVariantConst v = root[key];
    present = !v.isNull();
    if (!present) {
        return true;
    }
    if (!v.is<const char*>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "'%s' must be a string", key);
        return false;
    }
    value = v.as<const char*>();
    if (!allowEmpty && value[0] == '\0') {
        snprintf(errorMsg, MAX_ERROR_MSG, "'%s' must not be empty", key);
        return false;
    }
    return true;
}

// ============================================================================
// Decode
// ============================================================================

ConfigDecodeResult ConfigCodec::decode(JsonObjectConst root, const config::AppConfig& base) {
    ConfigDecodeResult result;
    result.config = base;
    config::AppConfig& cfg = result.config;

    const char* unknown = findUnknownKey(root);
    if (unknown != nullptr) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Unknown key '%s' in config", unknown);
        return result;
    }

    bool present = false;
    int64_t n = 0;
    const char* s = nullptr;

    if (!readString(root, "cache_dir", false, present, s, result.errorMsg)) return result;
    if (present) cfg.cacheDir = s;

    if (!readString(root, "snapshot_path", true, present, s, result.errorMsg)) return result;
    if (present) cfg.snapshotPath = s;

    if (!readRange(root, "interval_sec", 0, 86400, present, n, result.errorMsg)) return result;
    if (present) cfg.intervalSec = static_cast<uint32_t>(n);

    if (!readRange(root, "max_loops", 0, UINT32_MAX, present, n, result.errorMsg)) return result;
    if (present) cfg.maxLoops = static_cast<uint32_t>(n);

    if (!readRange(root, "pattern_length", 0, config::PatternDefaults::MAX_LENGTH, present, n, result.errorMsg)) return result;
    if (present) cfg.patternLength = static_cast<size_t>(n);

    if (!readString(root, "pattern_mode", false, present, s, result.errorMsg)) return result;
    if (present) {
        pattern::PatternMode mode;
        if (!pattern::parsePatternMode(s, mode)) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Unknown pattern_mode '%s'", s);
            return result;
        }
        cfg.patternMode = s;
    }

    if (!readRange(root, "fetch_timeout_ms", 1, 600000, present, n, result.errorMsg)) return result;
    if (present) cfg.fetchTimeoutMs = static_cast<uint32_t>(n);

    if (!readRange(root, "max_dimension", 1, 4096, present, n, result.errorMsg)) return result;
    if (present) cfg.maxDimension = static_cast<uint16_t>(n);

    if (!readRange(root, "quantized_colours", 1, config::ExtractDefaults::MAX_QUANTIZED_COLOURS,
                   present, n, result.errorMsg)) return result;
    if (present) cfg.quantizedColours = static_cast<uint8_t>(n);

    if (!readRange(root, "near_white_threshold", 0, 255, present, n, result.errorMsg)) return result;
    if (present) cfg.nearWhiteThreshold = static_cast<uint8_t>(n);

    if (!readRange(root, "log_level", 0, 5, present, n, result.errorMsg)) return result;
    if (present) cfg.logLevel = static_cast<uint8_t>(n);

    JsonVariantConst swatches = root["swatches"];
    if (!swatches.isNull()) {
        if (!swatches.is<bool>()) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "'swatches' must be a boolean");
            return result;
        }
        cfg.swatches = swatches.as<bool>();
    }

    result.success = true;
    return result;
}

// ============================================================================
// Encode
// ============================================================================

void ConfigCodec::encode(const config::AppConfig& cfg, JsonObject& obj) {
    obj["cache_dir"] = cfg.cacheDir.c_str();
    obj["snapshot_path"] = cfg.snapshotPath.c_str();
    obj["interval_sec"] = cfg.intervalSec;
    obj["max_loops"] = cfg.maxLoops;
    obj["pattern_length"] = static_cast<uint32_t>(cfg.patternLength);
    obj["pattern_mode"] = cfg.patternMode.c_str();
    obj["fetch_timeout_ms"] = cfg.fetchTimeoutMs;
    obj["max_dimension"] = cfg.maxDimension;
    obj["quantized_colours"] = cfg.quantizedColours;
    obj["near_white_threshold"] = cfg.nearWhiteThreshold;
    obj["log_level"] = cfg.logLevel;
    obj["swatches"] = cfg.swatches;
}

} // namespace codec
} // namespace coverlight
