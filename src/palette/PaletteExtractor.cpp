// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PaletteExtractor.cpp
 * @brief Digest and image extraction paths
 */

#include "PaletteExtractor.h"

#include <algorithm>
#include <cstdio>

#include "DigestPalette.h"
#include "image/ImageDecoder.h"
#include "image/ImageOps.h"
#include "net/TempArtifact.h"
#include "utils/FileUtils.h"

#define CL_LOG_TAG "Extract"
#include "utils/Log.h"

namespace coverlight {
namespace palette {

namespace {

bool startsWith(const char* text, const char* prefix) {
    return strncmp(text, prefix, strlen(prefix)) == 0;
}

bool containsColour(const ColourHex* colours, size_t count, const ColourHex& c) {
    for (size_t i = 0; i < count; ++i) {
        if (colours[i] == c) {
            return true;
        }
    }
    return false;
}

void fail(ExtractResult& result, ErrorKind kind, const char* fmt, const char* detail) {
    result.success = false;
    result.error = kind;
    snprintf(result.errorMsg, MAX_ERROR_MSG, fmt, detail);
}

} // namespace

const char* extractModeName(ExtractMode mode) {
    switch (mode) {
        case ExtractMode::DIGEST: return "digest";
        case ExtractMode::IMAGE:  return "image";
        default:                  return "unknown";
    }
}

PaletteExtractor::PaletteExtractor(net::IResourceFetcher& fetcher, const ExtractOptions& options)
    : m_fetcher(fetcher), m_options(options) {}

bool PaletteExtractor::isFetchable(const char* sourceIdentifier) {
    if (sourceIdentifier == nullptr) {
        return false;
    }
    return startsWith(sourceIdentifier, "http://") ||
           startsWith(sourceIdentifier, "https://") ||
           startsWith(sourceIdentifier, "file://");
}

ExtractResult PaletteExtractor::extract(const char* sourceIdentifier) const {
    if (sourceIdentifier == nullptr) {
        sourceIdentifier = "";
    }
    if (isFetchable(sourceIdentifier)) {
        return extractImage(sourceIdentifier);
    }
    return extractDigest(sourceIdentifier);
}

ExtractResult PaletteExtractor::extractDigest(const char* sourceIdentifier) const {
    ExtractResult result;
    result.mode = ExtractMode::DIGEST;

    if (!digestPalette(sourceIdentifier, result.palette)) {
        fail(result, ErrorKind::PALETTE_EXHAUSTED, "Digest backend failed for '%s'", sourceIdentifier);
        return result;
    }

    result.success = true;
    CL_EXTRACT_LOGD("Digest palette for '%s'", sourceIdentifier);
    return result;
}

ExtractResult PaletteExtractor::extractImage(const char* locator) const {
    ExtractResult result;
    result.mode = ExtractMode::IMAGE;

    std::vector<uint8_t> bytes;
    {
        // Removed at the end of this scope whatever happens below
        net::TempArtifact artifact;
        std::string suffix = net::artifactSuffixFor(locator);
        if (!artifact.create(m_options.cacheDir.c_str(), suffix.c_str())) {
            fail(result, ErrorKind::RETRIEVAL_FAILURE, "Cannot create temp file in '%s'",
                 m_options.cacheDir.c_str());
            return result;
        }

        net::FetchResult fetched = m_fetcher.fetch(locator, artifact.stream());
        if (!fetched.success) {
            result.error = ErrorKind::RETRIEVAL_FAILURE;
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Fetch failed (%s): %s",
                     net::fetchStatusName(fetched.status), fetched.errorMsg);
            CL_EXTRACT_LOGW("%s", result.errorMsg);
            return result;
        }

        if (!artifact.rewind() || !utils::readStream(artifact.stream(), bytes)) {
            fail(result, ErrorKind::RETRIEVAL_FAILURE, "Cannot read back '%s'", artifact.path().c_str());
            return result;
        }
    }

    CL_EXTRACT_LOGD("Fetched %zu bytes from %s", bytes.size(), locator);
    return extractFromImageBytes(bytes.data(), bytes.size());
}

ExtractResult PaletteExtractor::extractFromImageBytes(const uint8_t* data, size_t length) const {
    ExtractResult result;
    result.mode = ExtractMode::IMAGE;

    image::RgbaImage decoded;
    image::DecodeResult dr = image::decodeImage(data, length, decoded);
    if (!dr.success) {
        result.error = ErrorKind::DECODE_FAILURE;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Decode failed: %s", dr.errorMsg);
        CL_EXTRACT_LOGW("%s", result.errorMsg);
        return result;
    }
    CL_EXTRACT_LOGD("Decoded %s %ux%u", image::imageFormatName(dr.format),
                    static_cast<unsigned>(decoded.width), static_cast<unsigned>(decoded.height));

    image::RgbImage opaque;
    image::compositeOverWhite(decoded, opaque);

    image::RgbImage scaled;
    image::downscaleToFit(opaque, m_options.maxDimension, scaled);

    const uint8_t maxEntries = std::min(m_options.quantizedColours,
                                        config::ExtractDefaults::MAX_QUANTIZED_COLOURS);
    std::vector<image::QuantizedEntry> entries;
    image::quantizeMedianCut(scaled, maxEntries, entries);
    CL_EXTRACT_LOGT("Median cut produced %zu entries from %ux%u", entries.size(),
                    static_cast<unsigned>(scaled.width), static_cast<unsigned>(scaled.height));

    Palette fallback;
    if (!digestPalette(data, length, fallback)) {
        result.error = ErrorKind::PALETTE_EXHAUSTED;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Digest fallback unavailable");
        return result;
    }

    if (!selectDominantColours(entries, m_options.nearWhiteThreshold, fallback,
                               result.palette, result.toppedUp)) {
        result.error = ErrorKind::PALETTE_EXHAUSTED;
        snprintf(result.errorMsg, MAX_ERROR_MSG,
                 "Fewer than %u distinct colours after fallback", static_cast<unsigned>(PALETTE_SIZE));
        CL_EXTRACT_LOGW("%s", result.errorMsg);
        return result;
    }

    if (result.toppedUp > 0) {
        CL_EXTRACT_LOGI("Topped up %u colour(s) from digest fallback", static_cast<unsigned>(result.toppedUp));
    }
    result.success = true;
    return result;
}

bool selectDominantColours(const std::vector<image::QuantizedEntry>& entries,
                           uint8_t nearWhiteThreshold,
                           const Palette& fallback,
                           Palette& out,
                           uint8_t& toppedUp) {
    std::vector<image::QuantizedEntry> ranked(entries);
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const image::QuantizedEntry& a, const image::QuantizedEntry& b) {
                         return a.count > b.count;
                     });

    ColourHex chosen[PALETTE_SIZE];
    size_t held = 0;
    toppedUp = 0;

    for (size_t i = 0; i < ranked.size() && held < PALETTE_SIZE; ++i) {
        if (image::isNearWhite(ranked[i].colour, nearWhiteThreshold)) {
            continue;
        }
        ColourHex hex(ranked[i].colour);
        if (containsColour(chosen, held, hex)) {
            continue;
        }
        chosen[held++] = hex;
    }

    for (size_t i = 0; i < PALETTE_SIZE && held < PALETTE_SIZE; ++i) {
        if (containsColour(chosen, held, fallback[i])) {
            continue;
        }
        chosen[held++] = fallback[i];
        ++toppedUp;
    }

    if (held < PALETTE_SIZE) {
        return false;
    }
    for (size_t i = 0; i < PALETTE_SIZE; ++i) {
        out[i] = chosen[i];
    }
    return true;
}

} // namespace palette
} // namespace coverlight
