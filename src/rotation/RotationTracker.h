// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RotationTracker.h
 * @brief Phase state machine across successive polls
 *
 * Transitions per step(idNow):
 *
 *   idNow == nullptr      -> no change, nothing emitted
 *   idNow != previous     -> extract, base = palette, phase = 0
 *   idNow == previous     -> phase = (phase + 1) % 4
 *
 * Emission is rotatePalette(base, phase). A failed extraction leaves the
 * state exactly as it was, so the next poll retries.
 *
 * One tracker belongs to one polling loop; it is not thread-safe.
 */

#pragma once

#include "core/CoverTypes.h"
#include "palette/PaletteExtractor.h"

#include <cstdint>
#include <cstring>
#include <string>

namespace coverlight {
namespace rotation {

struct RotationState {
    bool hasPrevious = false;
    std::string previousSourceIdentifier;
    bool hasBase = false;
    Palette basePalette;
    uint8_t phase = 0;
};

struct RotationStep {
    bool success;
    bool emitted;               ///< false when idNow was null
    bool freshExtraction;       ///< true when the extractor ran this step
    ErrorKind error;
    uint8_t phase;
    Palette rotatedBase;
    char errorMsg[MAX_ERROR_MSG];

    RotationStep() : success(false), emitted(false), freshExtraction(false),
                     error(ErrorKind::NONE), phase(0) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class RotationTracker {
public:
    explicit RotationTracker(const palette::PaletteExtractor& extractor);

    /**
     * @brief Advance one poll
     * @param idNow Current identifier, nullptr when nothing is playing
     */
    RotationStep step(const char* idNow);

    const RotationState& state() const { return m_state; }

    /**
     * @brief Forget the previous identifier and base palette
     */
    void reset();

private:
    const palette::PaletteExtractor& m_extractor;
    RotationState m_state;
};

} // namespace rotation
} // namespace coverlight
