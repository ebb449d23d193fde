// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PatternGenerator.h
 * @brief Expands a four-colour palette into a fixed-length LED pattern
 *
 * Modes:
 * - repeat: out[i] = base[i % 4]
 * - mirror: out[i] = cycle[i % 8], cycle = base followed by base reversed
 * - rotate: same as repeat within one call. Animation across calls comes
 *           from the rotation tracker handing in a pre-rotated base.
 *
 * Stateless and deterministic.
 */

#pragma once

#include "core/CoverTypes.h"

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace coverlight {
namespace pattern {

enum class PatternMode : uint8_t {
    REPEAT = 0,
    MIRROR,
    ROTATE,
    MODE_COUNT
};

const char* patternModeName(PatternMode mode);

/**
 * @brief Look up a mode by its lowercase name
 * @return false for names outside the closed set
 */
bool parsePatternMode(const char* name, PatternMode& out);

struct PatternResult {
    bool success;
    ErrorKind error;
    Pattern pattern;
    char errorMsg[MAX_ERROR_MSG];

    PatternResult() : success(false), error(ErrorKind::NONE) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class PatternGenerator {
public:
    /**
     * @brief Generate from an arbitrary colour sequence
     *
     * Anything other than exactly PALETTE_SIZE colours is INVALID_INPUT;
     * no padding or truncation is attempted.
     */
    static PatternResult generate(const ColourHex* colours, size_t count, size_t length, PatternMode mode);

    static PatternResult generate(const Palette& base, size_t length, PatternMode mode);

    /**
     * @brief Generate with the mode given by name ("repeat", "mirror", "rotate")
     */
    static PatternResult generate(const Palette& base, size_t length, const char* modeName);
};

} // namespace pattern
} // namespace coverlight
