// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RotationTracker.cpp
 * @brief Rotation state transitions
 */

#include "RotationTracker.h"

#include <cstdio>

#define CL_LOG_TAG "Rotation"
#include "utils/Log.h"

namespace coverlight {
namespace rotation {

RotationTracker::RotationTracker(const palette::PaletteExtractor& extractor)
    : m_extractor(extractor) {}

RotationStep RotationTracker::step(const char* idNow) {
    RotationStep out;

    if (idNow == nullptr) {
        out.success = true;
        out.phase = m_state.phase;
        CL_PATTERN_LOGT("Nothing playing, state kept");
        return out;
    }

    if (m_state.hasPrevious && m_state.hasBase && m_state.previousSourceIdentifier == idNow) {
        m_state.phase = static_cast<uint8_t>((m_state.phase + 1) % PALETTE_SIZE);
        CL_PATTERN_LOGD("Same artwork, phase -> %u", static_cast<unsigned>(m_state.phase));
    } else {
        palette::ExtractResult extracted = m_extractor.extract(idNow);
        out.freshExtraction = true;
        if (!extracted.success) {
            out.error = extracted.error;
            out.phase = m_state.phase;
            snprintf(out.errorMsg, MAX_ERROR_MSG, "%s", extracted.errorMsg);
            CL_PATTERN_LOGW("Extraction failed (%s), state kept", errorKindName(extracted.error));
            return out;
        }

        m_state.hasPrevious = true;
        m_state.previousSourceIdentifier = idNow;
        m_state.hasBase = true;
        m_state.basePalette = extracted.palette;
        m_state.phase = 0;
        CL_PATTERN_LOGI("New artwork (%s mode), phase reset", palette::extractModeName(extracted.mode));
    }

    out.success = true;
    out.emitted = true;
    out.phase = m_state.phase;
    out.rotatedBase = rotatePalette(m_state.basePalette, m_state.phase);
    return out;
}

void RotationTracker::reset() {
    m_state = RotationState();
}

} // namespace rotation
} // namespace coverlight
