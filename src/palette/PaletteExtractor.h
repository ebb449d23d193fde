// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PaletteExtractor.h
 * @brief Source identifier -> exactly four dominant colours
 *
 * CoverLight - Palette Extractor
 *
 * Two modes, chosen per identifier:
 * - Digest mode for anything that is not an http://, https:// or file://
 *   locator. MD5 of the identifier bytes, never fails.
 * - Image mode for fetchable locators. The artwork is fetched into a temp
 *   file in the cache directory, decoded, flattened over white, downscaled,
 *   median-cut quantized and reduced to the four most populous non-white
 *   colours. Short results are topped up from the digest of the raw image
 *   bytes.
 *
 * The extractor holds no state between calls besides its options.
 */

#pragma once

#include "core/CoverTypes.h"
#include "config/defaults.h"
#include "image/ImageTypes.h"
#include "net/IResourceFetcher.h"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace coverlight {
namespace palette {

enum class ExtractMode : uint8_t {
    DIGEST = 0,
    IMAGE
};

const char* extractModeName(ExtractMode mode);

struct ExtractOptions {
    std::string cacheDir = config::ExtractDefaults::CACHE_DIR;
    uint16_t maxDimension = config::ExtractDefaults::MAX_DIMENSION;
    uint8_t quantizedColours = config::ExtractDefaults::QUANTIZED_COLOURS;   ///< Capped at MAX_QUANTIZED_COLOURS
    uint8_t nearWhiteThreshold = config::ExtractDefaults::NEAR_WHITE_THRESHOLD;
};

struct ExtractResult {
    bool success;
    ErrorKind error;
    ExtractMode mode;
    Palette palette;
    uint8_t toppedUp;           ///< Colours taken from the digest fallback
    char errorMsg[MAX_ERROR_MSG];

    ExtractResult() : success(false), error(ErrorKind::NONE), mode(ExtractMode::DIGEST), toppedUp(0) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class PaletteExtractor {
public:
    /**
     * @param fetcher Retrieval backend, must outlive the extractor
     * @param options Cache directory and image pipeline tuning
     */
    PaletteExtractor(net::IResourceFetcher& fetcher, const ExtractOptions& options);

    /**
     * @brief Produce the palette for one identifier
     * @param sourceIdentifier Identifier or locator (nullptr treated as "")
     */
    ExtractResult extract(const char* sourceIdentifier) const;

    /**
     * @brief Image-mode steps 2-7 on already retrieved bytes
     *
     * Exposed so the image pipeline can be driven without a fetcher.
     */
    ExtractResult extractFromImageBytes(const uint8_t* data, size_t length) const;

    /**
     * @brief True for http://, https:// and file:// locators
     */
    static bool isFetchable(const char* sourceIdentifier);

    const ExtractOptions& getOptions() const { return m_options; }

private:
    ExtractResult extractDigest(const char* sourceIdentifier) const;
    ExtractResult extractImage(const char* locator) const;

    net::IResourceFetcher& m_fetcher;
    ExtractOptions m_options;
};

/**
 * @brief Steps 5-7 of image mode: rank, filter, dedupe and top up
 *
 * @param entries Quantized entries in box order
 * @param nearWhiteThreshold Channel floor for near-white rejection
 * @param fallback Digest colours used to fill missing slots
 * @param out Receives the palette when four colours were found
 * @param toppedUp Receives the number of fallback colours used
 * @return false when fewer than four distinct colours remain
 */
bool selectDominantColours(const std::vector<image::QuantizedEntry>& entries,
                           uint8_t nearWhiteThreshold,
                           const Palette& fallback,
                           Palette& out,
                           uint8_t& toppedUp);

} // namespace palette
} // namespace coverlight
