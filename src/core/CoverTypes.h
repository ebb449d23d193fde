// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file CoverTypes.h
 * @brief Common types for palettes, patterns and error reporting
 *
 * CoverLight - Core Types
 *
 * Provides:
 * - ColourHex: immutable "#RRGGBB" colour value
 * - Palette: exactly PALETTE_SIZE colours, ordered
 * - Pattern: variable-length colour sequence
 * - ErrorKind: failure classes shared by extraction and pattern generation
 */

#pragma once

#include <FastLED.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace coverlight {

/**
 * @brief Number of colours in every palette
 */
static constexpr size_t PALETTE_SIZE = 4;

/**
 * @brief Maximum length for error messages
 */
static constexpr size_t MAX_ERROR_MSG = 128;

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind : uint8_t {
    NONE = 0,
    INVALID_INPUT,          ///< Palette not 4 colours, unknown mode, bad argument
    RETRIEVAL_FAILURE,      ///< Fetch failed: network error, non-2xx, timeout, I/O
    DECODE_FAILURE,         ///< Bytes are not a decodable image
    PALETTE_EXHAUSTED       ///< Fewer than 4 colours even after fallback
};

const char* errorKindName(ErrorKind kind);

// ============================================================================
// ColourHex
// ============================================================================

/**
 * @brief One RGB colour as "#RRGGBB" with uppercase hex digits
 *
 * Value type: the text is fixed at construction. Default-constructed
 * instances hold "#000000".
 */
class ColourHex {
public:
    static constexpr size_t TEXT_LENGTH = 7;

    ColourHex();
    explicit ColourHex(const CRGB& rgb);
    ColourHex(uint8_t r, uint8_t g, uint8_t b);

    /**
     * @brief Parse "#RRGGBB" (either hex case)
     * @param text Null-terminated text, exactly 7 characters
     * @param out Receives the canonical uppercase colour on success
     * @return false if text is not a well-formed colour
     */
    static bool parse(const char* text, ColourHex& out);

    const char* c_str() const { return m_text; }
    CRGB rgb() const { return CRGB(m_r, m_g, m_b); }

    bool operator==(const ColourHex& other) const;
    bool operator!=(const ColourHex& other) const { return !(*this == other); }

private:
    uint8_t m_r;
    uint8_t m_g;
    uint8_t m_b;
    char m_text[TEXT_LENGTH + 1];
};

/**
 * @brief Ordered base cycle of exactly PALETTE_SIZE colours
 */
typedef std::array<ColourHex, PALETTE_SIZE> Palette;

/**
 * @brief Ordered colour sequence of caller-chosen length
 */
typedef std::vector<ColourHex> Pattern;

/**
 * @brief Left-rotate a palette by phase positions
 *
 * rotated[i] = base[(i + phase) % PALETTE_SIZE], so phase 2 turns
 * [A,B,C,D] into [C,D,A,B].
 */
Palette rotatePalette(const Palette& base, uint8_t phase);

/**
 * @brief Join colours as "c1,c2,..." into out (truncates to outSize)
 */
void joinColours(const ColourHex* colours, size_t count, char* out, size_t outSize);

} // namespace coverlight
