// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file CoverTypes.cpp
 * @brief ColourHex formatting/parsing and palette helpers
 */

#include "CoverTypes.h"

#include <cstdio>
#include <cstring>

namespace coverlight {

namespace {

int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:              return "None";
        case ErrorKind::INVALID_INPUT:     return "InvalidInput";
        case ErrorKind::RETRIEVAL_FAILURE: return "RetrievalFailure";
        case ErrorKind::DECODE_FAILURE:    return "DecodeFailure";
        case ErrorKind::PALETTE_EXHAUSTED: return "PaletteExhausted";
        default:                           return "Unknown";
    }
}

// ============================================================================
// ColourHex
// ============================================================================

ColourHex::ColourHex() : ColourHex(0, 0, 0) {}

ColourHex::ColourHex(const CRGB& rgb) : ColourHex(rgb.r, rgb.g, rgb.b) {}

ColourHex::ColourHex(uint8_t r, uint8_t g, uint8_t b)
    : m_r(r), m_g(g), m_b(b) {
    snprintf(m_text, sizeof(m_text), "#%02X%02X%02X", r, g, b);
}

bool ColourHex::parse(const char* text, ColourHex& out) {
    if (text == nullptr || strlen(text) != TEXT_LENGTH || text[0] != '#') {
        return false;
    }
    uint8_t channels[3];
    for (size_t i = 0; i < 3; ++i) {
        int hi = hexNibble(text[1 + i * 2]);
        int lo = hexNibble(text[2 + i * 2]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        channels[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    out = ColourHex(channels[0], channels[1], channels[2]);
    return true;
}

bool ColourHex::operator==(const ColourHex& other) const {
    return m_r == other.m_r && m_g == other.m_g && m_b == other.m_b;
}

// ============================================================================
// Palette helpers
// ============================================================================

Palette rotatePalette(const Palette& base, uint8_t phase) {
    Palette rotated;
    for (size_t i = 0; i < PALETTE_SIZE; ++i) {
        rotated[i] = base[(i + phase) % PALETTE_SIZE];
    }
    return rotated;
}

void joinColours(const ColourHex* colours, size_t count, char* out, size_t outSize) {
    if (out == nullptr || outSize == 0) {
        return;
    }
    out[0] = '\0';
    size_t used = 0;
    for (size_t i = 0; i < count; ++i) {
        int written = snprintf(out + used, outSize - used, "%s%s",
                               i == 0 ? "" : ",", colours[i].c_str());
        if (written < 0 || static_cast<size_t>(written) >= outSize - used) {
            return;
        }
        used += static_cast<size_t>(written);
    }
}

} // namespace coverlight
