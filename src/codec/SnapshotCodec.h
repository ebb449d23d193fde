// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SnapshotCodec.h
 * @brief JSON codec for the per-cycle palette snapshot
 *
 * Single canonical location for the snapshot file's JSON keys:
 *
 * @code
 * {
 *   "timestamp": "2026-01-31 18:04:05",
 *   "artwork_identifier": "https://..." | null,
 *   "base_palette": ["#RRGGBB", x4] | [],
 *   "phase": 0..3,
 *   "pattern": ["#RRGGBB", ...] | null
 * }
 * @endcode
 *
 * Rule: only this module reads or writes snapshot keys. Everything else uses
 * SnapshotData.
 */

#pragma once

#include <ArduinoJson.h>
#include <stdint.h>
#include <cstddef>
#include <cstring>
#include <string>

#include "core/CoverTypes.h"

namespace coverlight {
namespace codec {

/**
 * @brief One poll cycle as persisted
 */
struct SnapshotData {
    std::string timestamp;              ///< "YYYY-MM-DD HH:MM:SS", local time
    bool hasArtwork;
    std::string artworkIdentifier;
    bool hasBase;                       ///< false encodes base_palette as []
    Palette basePalette;                ///< Rotated base of this cycle
    uint8_t phase;
    bool hasPattern;                    ///< false encodes pattern as null
    Pattern pattern;

    SnapshotData() : hasArtwork(false), hasBase(false), phase(0), hasPattern(false) {}
};

struct SnapshotDecodeResult {
    bool success;
    SnapshotData snapshot;
    char errorMsg[MAX_ERROR_MSG];

    SnapshotDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

/**
 * @brief Snapshot JSON codec
 *
 * Decoding enforces:
 * - Required keys with the right types
 * - base_palette of exactly 0 or 4 well-formed colours
 * - phase in [0, 4)
 * - Unknown-key rejection
 */
class SnapshotCodec {
public:
    static void encode(const SnapshotData& data, JsonObject& obj);
    static SnapshotDecodeResult decode(JsonObjectConst root);
};

} // namespace codec
} // namespace coverlight
