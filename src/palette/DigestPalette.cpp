// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DigestPalette.cpp
 * @brief MD5-sliced palette implementation
 */

#include "DigestPalette.h"

#include <cstring>

#include "mbedtls/md5.h"

#define CL_LOG_TAG "Digest"
#include "utils/Log.h"

namespace coverlight {
namespace palette {

Palette paletteFromDigest(const uint8_t* digest, size_t digestLength) {
    Palette out;
    if (digest == nullptr || digestLength == 0) {
        return out;
    }
    for (size_t i = 0; i < PALETTE_SIZE; ++i) {
        size_t start = (i * 3) % digestLength;
        uint8_t r = digest[start % digestLength];
        uint8_t g = digest[(start + 1) % digestLength];
        uint8_t b = digest[(start + 2) % digestLength];
        out[i] = ColourHex(r, g, b);
    }
    return out;
}

bool digestPalette(const uint8_t* data, size_t length, Palette& out) {
    uint8_t digest[DIGEST_LENGTH];
    memset(digest, 0, sizeof(digest));

    mbedtls_md5_context ctx;
    mbedtls_md5_init(&ctx);
    int rc = mbedtls_md5_starts(&ctx);
    if (rc == 0 && length > 0) {
        rc = mbedtls_md5_update(&ctx, data, length);
    }
    if (rc == 0) {
        rc = mbedtls_md5_finish(&ctx, digest);
    }
    mbedtls_md5_free(&ctx);

    if (rc != 0) {
        CL_LOGE("MD5 failed (rc=%d)", rc);
        return false;
    }

    out = paletteFromDigest(digest, sizeof(digest));
    CL_EXTRACT_LOGT("Digest palette over %zu bytes: %s %s %s %s", length,
                    out[0].c_str(), out[1].c_str(), out[2].c_str(), out[3].c_str());
    return true;
}

bool digestPalette(const char* text, Palette& out) {
    if (text == nullptr) {
        text = "";
    }
    return digestPalette(reinterpret_cast<const uint8_t*>(text), strlen(text), out);
}

} // namespace palette
} // namespace coverlight
