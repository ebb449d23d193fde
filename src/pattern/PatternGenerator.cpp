// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PatternGenerator.cpp
 * @brief Pattern mode implementations
 */

#include "PatternGenerator.h"

#include <cstdio>

#define CL_LOG_TAG "Pattern"
#include "utils/Log.h"

namespace coverlight {
namespace pattern {

namespace {

const char* const MODE_NAMES[] = {
    "repeat",
    "mirror",
    "rotate"
};

static_assert(sizeof(MODE_NAMES) / sizeof(MODE_NAMES[0]) ==
              static_cast<size_t>(PatternMode::MODE_COUNT),
              "MODE_NAMES must cover every PatternMode");

constexpr size_t MIRROR_CYCLE = PALETTE_SIZE * 2;

} // namespace

const char* patternModeName(PatternMode mode) {
    size_t idx = static_cast<size_t>(mode);
    if (idx >= static_cast<size_t>(PatternMode::MODE_COUNT)) {
        return "unknown";
    }
    return MODE_NAMES[idx];
}

bool parsePatternMode(const char* name, PatternMode& out) {
    if (name == nullptr) {
        return false;
    }
    for (size_t i = 0; i < static_cast<size_t>(PatternMode::MODE_COUNT); ++i) {
        if (strcmp(name, MODE_NAMES[i]) == 0) {
            out = static_cast<PatternMode>(i);
            return true;
        }
    }
    return false;
}

PatternResult PatternGenerator::generate(const ColourHex* colours, size_t count, size_t length, PatternMode mode) {
    PatternResult result;

    if (colours == nullptr || count != PALETTE_SIZE) {
        result.error = ErrorKind::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Palette must have exactly %u colours, got %u",
                 static_cast<unsigned>(PALETTE_SIZE), static_cast<unsigned>(colours ? count : 0));
        CL_PATTERN_LOGW("%s", result.errorMsg);
        return result;
    }

    result.pattern.reserve(length);
    switch (mode) {
        case PatternMode::REPEAT:
        case PatternMode::ROTATE:
            for (size_t i = 0; i < length; ++i) {
                result.pattern.push_back(colours[i % PALETTE_SIZE]);
            }
            break;

        case PatternMode::MIRROR:
            for (size_t i = 0; i < length; ++i) {
                size_t pos = i % MIRROR_CYCLE;
                size_t src = (pos < PALETTE_SIZE) ? pos : (MIRROR_CYCLE - 1 - pos);
                result.pattern.push_back(colours[src]);
            }
            break;

        default:
            result.pattern.clear();
            result.error = ErrorKind::INVALID_INPUT;
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Unknown pattern mode %u",
                     static_cast<unsigned>(mode));
            CL_PATTERN_LOGW("%s", result.errorMsg);
            return result;
    }

    result.success = true;
    CL_PATTERN_LOGT("Generated %zu entries (%s)", length, patternModeName(mode));
    return result;
}

PatternResult PatternGenerator::generate(const Palette& base, size_t length, PatternMode mode) {
    return generate(base.data(), base.size(), length, mode);
}

PatternResult PatternGenerator::generate(const Palette& base, size_t length, const char* modeName) {
    PatternMode mode;
    if (!parsePatternMode(modeName, mode)) {
        PatternResult result;
        result.error = ErrorKind::INVALID_INPUT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Unknown pattern mode '%s'",
                 modeName ? modeName : "(null)");
        CL_PATTERN_LOGW("%s", result.errorMsg);
        return result;
    }
    return generate(base, length, mode);
}

} // namespace pattern
} // namespace coverlight
