// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DigestPalette.h
 * @brief Deterministic palette derived from an MD5 digest
 *
 * Used for identifiers that are not fetchable (test fixtures, opaque ids)
 * and as the top-up source when an image yields fewer than four colours.
 *
 * Colour i takes digest bytes (3i + k) mod 16 for k = 0..2 as R, G, B.
 */

#pragma once

#include "core/CoverTypes.h"

#include <cstddef>
#include <cstdint>

namespace coverlight {
namespace palette {

static constexpr size_t DIGEST_LENGTH = 16;

/**
 * @brief Palette from the digest of a byte buffer
 * @param data Bytes to hash (may be nullptr when length is 0)
 * @param length Byte count
 * @param out Receives the palette
 * @return false only if the digest backend reports an internal error
 */
bool digestPalette(const uint8_t* data, size_t length, Palette& out);

/**
 * @brief Palette from the digest of a null-terminated string's bytes
 *
 * nullptr is treated as the empty string.
 */
bool digestPalette(const char* text, Palette& out);

/**
 * @brief Slice a digest into PALETTE_SIZE RGB groups, wrapping cyclically
 */
Palette paletteFromDigest(const uint8_t* digest, size_t digestLength);

} // namespace palette
} // namespace coverlight
