// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ImageOps.h
 * @brief Compositing, downscaling and adaptive quantization for artwork
 *
 * Pipeline used by the palette extractor:
 *   RgbaImage --compositeOverWhite--> RgbImage --downscaleToFit--> RgbImage
 *             --quantizeMedianCut--> QuantizedEntry[] (colour + pixel count)
 *
 * All operations are deterministic for a given input.
 */

#pragma once

#include "ImageTypes.h"

#include <cstdint>
#include <vector>

namespace coverlight {
namespace image {

/**
 * @brief Flatten alpha against a white background
 *
 * Each pixel becomes blend(White, pixel, alpha). Fully opaque pixels are
 * copied unchanged; fully transparent pixels become pure white.
 */
void compositeOverWhite(const RgbaImage& src, RgbImage& out);

/**
 * @brief Aspect-preserving area-average downscale
 *
 * Images whose longest side is already <= maxDimension are copied as-is.
 * Otherwise the longest side becomes maxDimension and the other side is
 * scaled proportionally (minimum 1 pixel).
 */
void downscaleToFit(const RgbImage& src, uint32_t maxDimension, RgbImage& out);

/**
 * @brief Weighted median-cut reduction to at most maxColours entries
 *
 * If the image has no more than maxColours distinct colours those colours are
 * returned exactly. Otherwise colour boxes are split at the pixel-weighted
 * median of their widest channel, always splitting the box holding the most
 * pixels. Every distinct colour is then mapped to its nearest entry (squared
 * RGB distance, lowest index wins ties) and entry counts are the pixel totals.
 * Entries that receive no pixels are dropped. Order is box order, not count.
 */
void quantizeMedianCut(const RgbImage& img, uint8_t maxColours, std::vector<QuantizedEntry>& out);

/**
 * @brief True when every channel is at or above threshold
 */
inline bool isNearWhite(const CRGB& c, uint8_t threshold) {
    return c.r >= threshold && c.g >= threshold && c.b >= threshold;
}

} // namespace image
} // namespace coverlight
