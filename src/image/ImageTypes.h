// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ImageTypes.h
 * @brief Pixel buffers used by the artwork pipeline
 */

#pragma once

#include <FastLED.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace coverlight {
namespace image {

/**
 * @brief Decoded image, 4 bytes per pixel (R, G, B, A), row-major
 */
struct RgbaImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgba;

    size_t pixelCount() const { return static_cast<size_t>(width) * height; }
};

/**
 * @brief Opaque image, one CRGB per pixel, row-major
 */
struct RgbImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<CRGB> pixels;

    size_t pixelCount() const { return static_cast<size_t>(width) * height; }
    const CRGB& at(uint32_t x, uint32_t y) const { return pixels[static_cast<size_t>(y) * width + x]; }
};

/**
 * @brief One adaptive palette entry and the number of pixels mapped to it
 */
struct QuantizedEntry {
    CRGB colour;
    uint32_t count = 0;
};

} // namespace image
} // namespace coverlight
