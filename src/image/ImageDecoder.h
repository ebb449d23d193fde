// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ImageDecoder.h
 * @brief JPEG / PNG decoding into RGBA buffers
 *
 * Format is chosen from the leading magic bytes, not from the locator's
 * extension. JPEG goes through libjpeg, PNG through the libpng simplified API.
 */

#pragma once

#include "ImageTypes.h"
#include "core/CoverTypes.h"

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace coverlight {
namespace image {

/**
 * @brief Largest accepted width or height
 */
static constexpr uint32_t MAX_DECODE_DIMENSION = 16384;

enum class ImageFormat : uint8_t {
    UNKNOWN = 0,
    JPEG,
    PNG
};

enum class DecodeStatus : uint8_t {
    OK = 0,
    EMPTY,              // Zero bytes
    UNKNOWN_FORMAT,     // Magic bytes match neither JPEG nor PNG
    CORRUPT,            // Codec rejected the data
    TOO_LARGE           // Dimensions beyond MAX_DECODE_DIMENSION
};

struct DecodeResult {
    bool success;
    DecodeStatus status;
    ImageFormat format;
    char errorMsg[MAX_ERROR_MSG];

    DecodeResult() : success(false), status(DecodeStatus::EMPTY), format(ImageFormat::UNKNOWN) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

const char* imageFormatName(ImageFormat format);

/**
 * @brief Identify the container from magic bytes
 */
ImageFormat detectFormat(const uint8_t* data, size_t length);

/**
 * @brief Decode JPEG or PNG bytes into 8-bit RGBA
 * @param data Encoded bytes
 * @param length Byte count
 * @param out Receives the image; untouched contents are unspecified on failure
 */
DecodeResult decodeImage(const uint8_t* data, size_t length, RgbaImage& out);

} // namespace image
} // namespace coverlight
