// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SnapshotCodec.cpp
 * @brief Snapshot codec implementation
 */

#include "SnapshotCodec.h"

#include <cstdio>

namespace coverlight {
namespace codec {

static const char* SNAPSHOT_ALLOWED[] = {"timestamp", "artwork_identifier", "base_palette", "phase", "pattern"};

static bool hasUnknownKeys(JsonObjectConst root, const char* const* allowedKeys, size_t keyCount) {
    for (JsonPairConst pair : root) {
        const char* key = pair.key().c_str();
        bool isAllowed = false;
        for (size_t i = 0; i < keyCount; i++) {
            if (strcmp(key, allowedKeys[i]) == 0) {
                isAllowed = true;
                break;
            }
        }
        if (!isAllowed) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Encode
// ============================================================================

void SnapshotCodec::encode(const SnapshotData& data, JsonObject& obj) {
    obj["timestamp"] = data.timestamp.c_str();

    if (data.hasArtwork) {
        obj["artwork_identifier"] = data.artworkIdentifier.c_str();
    } else {
        obj["artwork_identifier"] = nullptr;
    }

    JsonArray base = obj["base_palette"].to<JsonArray>();
    if (data.hasBase) {
        for (size_t i = 0; i < PALETTE_SIZE; ++i) {
            base.add(data.basePalette[i].c_str());
        }
    }

    obj["phase"] = data.phase;

    if (data.hasPattern) {
        JsonArray pattern = obj["pattern"].to<JsonArray>();
        for (size_t i = 0; i < data.pattern.size(); ++i) {
            pattern.add(data.pattern[i].c_str());
        }
    } else {
        obj["pattern"] = nullptr;
    }
}

// ============================================================================
// Decode
// ============================================================================

SnapshotDecodeResult SnapshotCodec::decode(JsonObjectConst root) {
    SnapshotDecodeResult result;
    SnapshotData& snap = result.snapshot;

    if (hasUnknownKeys(root, SNAPSHOT_ALLOWED, sizeof(SNAPSHOT_ALLOWED) / sizeof(SNAPSHOT_ALLOWED[0]))) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Unknown keys in snapshot");
        return result;
    }

    if (!root["timestamp"].is<const char*>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'timestamp'");
        return result;
    }
    snap.timestamp = root["timestamp"].as<const char*>();

    JsonVariantConst artwork = root["artwork_identifier"];
    if (artwork.is<const char*>()) {
        snap.hasArtwork = true;
        snap.artworkIdentifier = artwork.as<const char*>();
    } else if (!artwork.isNull()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "'artwork_identifier' must be a string or null");
        return result;
    }

    if (!root["base_palette"].is<JsonArrayConst>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'base_palette'");
        return result;
    }
    JsonArrayConst base = root["base_palette"].as<JsonArrayConst>();
    if (base.size() != 0 && base.size() != PALETTE_SIZE) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "'base_palette' must hold 0 or %u colours, got %u",
                 static_cast<unsigned>(PALETTE_SIZE), static_cast<unsigned>(base.size()));
        return result;
    }
    size_t idx = 0;
    for (JsonVariantConst v : base) {
        if (!v.is<const char*>() || !ColourHex::parse(v.as<const char*>(), snap.basePalette[idx])) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid colour at base_palette[%u]", static_cast<unsigned>(idx));
            return result;
        }
        ++idx;
    }
    snap.hasBase = (idx == PALETTE_SIZE);

    if (!root["phase"].is<int>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'phase'");
        return result;
    }
    int phase = root["phase"].as<int>();
    if (phase < 0 || phase >= static_cast<int>(PALETTE_SIZE)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "phase out of range (0-3): %d", phase);
        return result;
    }
    snap.phase = static_cast<uint8_t>(phase);

    JsonVariantConst pattern = root["pattern"];
    if (pattern.is<JsonArrayConst>()) {
        snap.hasPattern = true;
        size_t i = 0;
        for (JsonVariantConst v : pattern.as<JsonArrayConst>()) {
            ColourHex c;
            if (!v.is<const char*>() || !ColourHex::parse(v.as<const char*>(), c)) {
                snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid colour at pattern[%u]", static_cast<unsigned>(i));
                return result;
            }
            snap.pattern.push_back(c);
            ++i;
        }
    } else if (!pattern.isNull()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "'pattern' must be an array or null");
        return result;
    }

    result.success = true;
    return result;
}

} // namespace codec
} // namespace coverlight
