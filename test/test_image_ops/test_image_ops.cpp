/**
 * @file test_image_ops.cpp
 * @brief Unit tests for decoding, compositing, downscaling and median cut
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include <cstdlib>
#include "test_images.h"
#include "../../src/image/ImageDecoder.h"
#include "../../src/image/ImageOps.h"

using namespace coverlight;
using namespace coverlight::image;

static RgbImage makeRgb(uint32_t w, uint32_t h, const CRGB& c) {
    RgbImage img;
    img.width = w;
    img.height = h;
    img.pixels.assign(static_cast<size_t>(w) * h, c);
    return img;
}

static uint64_t totalCount(const std::vector<QuantizedEntry>& entries) {
    uint64_t total = 0;
    for (const QuantizedEntry& e : entries) {
        total += e.count;
    }
    return total;
}

void setUp(void) {}
void tearDown(void) {}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

void test_detect_format_from_magic() {
    const uint8_t png[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0};
    const uint8_t jpg[] = {0xFF, 0xD8, 0xFF, 0xE0};
    const uint8_t txt[] = {'<', 'h', 't', 'm', 'l'};
    TEST_ASSERT_EQUAL(static_cast<int>(ImageFormat::PNG), static_cast<int>(detectFormat(png, sizeof(png))));
    TEST_ASSERT_EQUAL(static_cast<int>(ImageFormat::JPEG), static_cast<int>(detectFormat(jpg, sizeof(jpg))));
    TEST_ASSERT_EQUAL(static_cast<int>(ImageFormat::UNKNOWN), static_cast<int>(detectFormat(txt, sizeof(txt))));
    TEST_ASSERT_EQUAL(static_cast<int>(ImageFormat::UNKNOWN), static_cast<int>(detectFormat(png, 4)));
}

void test_decode_png_rgba() {
    std::vector<uint8_t> canvas = testimg::solid(6, 4, {10, 20, 30, 255});
    testimg::fillRows(canvas, 6, 2, 4, {200, 100, 50, 0});
    std::vector<uint8_t> png = testimg::encodePng(canvas, 6, 4);
    TEST_ASSERT_TRUE(png.size() > 0);

    RgbaImage img;
    DecodeResult r = decodeImage(png.data(), png.size(), img);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL(static_cast<int>(ImageFormat::PNG), static_cast<int>(r.format));
    TEST_ASSERT_EQUAL_UINT32(6, img.width);
    TEST_ASSERT_EQUAL_UINT32(4, img.height);
    TEST_ASSERT_EQUAL_UINT(6 * 4 * 4, img.rgba.size());
    TEST_ASSERT_EQUAL_UINT8(10, img.rgba[0]);
    TEST_ASSERT_EQUAL_UINT8(30, img.rgba[2]);
    TEST_ASSERT_EQUAL_UINT8(255, img.rgba[3]);
    TEST_ASSERT_EQUAL_UINT8(0, img.rgba[(3 * 6 + 5) * 4 + 3]);
}

void test_decode_jpeg_solid() {
    std::vector<uint8_t> jpg = testimg::encodeJpegSolid(16, 8, 200, 40, 40);
    RgbaImage img;
    DecodeResult r = decodeImage(jpg.data(), jpg.size(), img);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL(static_cast<int>(ImageFormat::JPEG), static_cast<int>(r.format));
    TEST_ASSERT_EQUAL_UINT32(16, img.width);
    TEST_ASSERT_EQUAL_UINT32(8, img.height);
    // Lossy: allow small error on a flat field
    TEST_ASSERT_INT_WITHIN(6, 200, img.rgba[0]);
    TEST_ASSERT_INT_WITHIN(6, 40, img.rgba[1]);
    TEST_ASSERT_INT_WITHIN(6, 40, img.rgba[2]);
    TEST_ASSERT_EQUAL_UINT8(255, img.rgba[3]);
}

void test_decode_rejects_garbage() {
    const char* html = "<html><body>not found</body></html>";
    RgbaImage img;
    DecodeResult r = decodeImage(reinterpret_cast<const uint8_t*>(html), strlen(html), img);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_EQUAL(static_cast<int>(DecodeStatus::UNKNOWN_FORMAT), static_cast<int>(r.status));
    TEST_ASSERT_TRUE(strlen(r.errorMsg) > 0);

    DecodeResult empty = decodeImage(nullptr, 0, img);
    TEST_ASSERT_FALSE(empty.success);
    TEST_ASSERT_EQUAL(static_cast<int>(DecodeStatus::EMPTY), static_cast<int>(empty.status));
}

void test_decode_rejects_truncated() {
    std::vector<uint8_t> png = testimg::encodePng(testimg::solid(32, 32, {1, 2, 3, 255}), 32, 32);
    png.resize(20);
    RgbaImage img;
    DecodeResult r = decodeImage(png.data(), png.size(), img);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_EQUAL(static_cast<int>(DecodeStatus::CORRUPT), static_cast<int>(r.status));

    std::vector<uint8_t> jpg = testimg::encodeJpegSolid(16, 16, 9, 9, 9);
    jpg.resize(12);
    DecodeResult rj = decodeImage(jpg.data(), jpg.size(), img);
    TEST_ASSERT_FALSE(rj.success);
    TEST_ASSERT_EQUAL(static_cast<int>(DecodeStatus::CORRUPT), static_cast<int>(rj.status));
}

// ---------------------------------------------------------------------------
// Compositing
// ---------------------------------------------------------------------------

void test_composite_over_white() {
    RgbaImage src;
    src.width = 3;
    src.height = 1;
    src.rgba = {
        12, 34, 56, 255,    // opaque: unchanged
        12, 34, 56, 0,      // transparent: white
        0, 0, 0, 128        // half black over white: mid grey
    };
    RgbImage out;
    compositeOverWhite(src, out);
    TEST_ASSERT_EQUAL_UINT32(3, out.width);
    TEST_ASSERT_EQUAL_UINT8(12, out.pixels[0].r);
    TEST_ASSERT_EQUAL_UINT8(34, out.pixels[0].g);
    TEST_ASSERT_EQUAL_UINT8(56, out.pixels[0].b);
    TEST_ASSERT_EQUAL_UINT8(255, out.pixels[1].r);
    TEST_ASSERT_EQUAL_UINT8(255, out.pixels[1].g);
    TEST_ASSERT_EQUAL_UINT8(255, out.pixels[1].b);
    TEST_ASSERT_INT_WITHIN(2, 127, out.pixels[2].r);
}

// ---------------------------------------------------------------------------
// Downscale
// ---------------------------------------------------------------------------

void test_downscale_preserves_aspect() {
    RgbImage src = makeRgb(400, 100, CRGB(90, 80, 70));
    RgbImage out;
    downscaleToFit(src, 200, out);
    TEST_ASSERT_EQUAL_UINT32(200, out.width);
    TEST_ASSERT_EQUAL_UINT32(50, out.height);
    TEST_ASSERT_EQUAL_UINT8(90, out.pixels[0].r);
    TEST_ASSERT_EQUAL_UINT8(70, out.pixels[out.pixels.size() - 1].b);

    RgbImage tall = makeRgb(30, 600, CRGB(1, 1, 1));
    downscaleToFit(tall, 200, out);
    TEST_ASSERT_EQUAL_UINT32(10, out.width);
    TEST_ASSERT_EQUAL_UINT32(200, out.height);
}

void test_downscale_never_enlarges() {
    RgbImage src = makeRgb(120, 80, CRGB(5, 6, 7));
    src.pixels[0] = CRGB(250, 0, 0);
    RgbImage out;
    downscaleToFit(src, 200, out);
    TEST_ASSERT_EQUAL_UINT32(120, out.width);
    TEST_ASSERT_EQUAL_UINT32(80, out.height);
    TEST_ASSERT_EQUAL_UINT8(250, out.pixels[0].r);
}

void test_downscale_averages_blocks() {
    // 4x2 checker of black/white columns shrinks to mid grey
    RgbImage src = makeRgb(4, 2, CRGB(0, 0, 0));
    for (uint32_t y = 0; y < 2; ++y) {
        src.pixels[y * 4 + 1] = CRGB(255, 255, 255);
        src.pixels[y * 4 + 3] = CRGB(255, 255, 255);
    }
    RgbImage out;
    downscaleToFit(src, 2, out);
    TEST_ASSERT_EQUAL_UINT32(2, out.width);
    TEST_ASSERT_EQUAL_UINT32(1, out.height);
    TEST_ASSERT_INT_WITHIN(1, 128, out.pixels[0].g);
    TEST_ASSERT_INT_WITHIN(1, 128, out.pixels[1].g);
}

// ---------------------------------------------------------------------------
// Median cut
// ---------------------------------------------------------------------------

void test_quantize_keeps_exact_colours_when_few() {
    RgbImage img = makeRgb(10, 1, CRGB(255, 0, 0));
    for (size_t i = 6; i < 10; ++i) img.pixels[i] = CRGB(0, 0, 255);
    img.pixels[9] = CRGB(0, 255, 0);

    std::vector<QuantizedEntry> entries;
    quantizeMedianCut(img, 8, entries);
    TEST_ASSERT_EQUAL_UINT(3, entries.size());
    TEST_ASSERT_EQUAL_UINT64(10, totalCount(entries));

    bool sawRed = false;
    for (const QuantizedEntry& e : entries) {
        if (e.colour == CRGB(255, 0, 0)) {
            sawRed = true;
            TEST_ASSERT_EQUAL_UINT32(6, e.count);
        }
    }
    TEST_ASSERT_TRUE(sawRed);
}

void test_quantize_reduces_to_limit() {
    // 64 distinct greys plus a large dark-red block
    RgbImage img = makeRgb(64, 4, CRGB(120, 10, 10));
    for (uint32_t x = 0; x < 64; ++x) {
        img.pixels[x] = CRGB(static_cast<uint8_t>(x * 4), static_cast<uint8_t>(x * 4), static_cast<uint8_t>(x * 4));
    }

    std::vector<QuantizedEntry> entries;
    quantizeMedianCut(img, 8, entries);
    TEST_ASSERT_TRUE(entries.size() <= 8);
    TEST_ASSERT_TRUE(entries.size() >= 2);
    TEST_ASSERT_EQUAL_UINT64(img.pixels.size(), totalCount(entries));
    for (const QuantizedEntry& e : entries) {
        TEST_ASSERT_TRUE(e.count > 0);
    }

    std::vector<QuantizedEntry> again;
    quantizeMedianCut(img, 8, again);
    TEST_ASSERT_EQUAL_UINT(entries.size(), again.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        TEST_ASSERT_TRUE(entries[i].colour == again[i].colour);
        TEST_ASSERT_EQUAL_UINT32(entries[i].count, again[i].count);
    }
}

void test_quantize_empty_image() {
    RgbImage img;
    std::vector<QuantizedEntry> entries;
    entries.push_back(QuantizedEntry());
    quantizeMedianCut(img, 8, entries);
    TEST_ASSERT_EQUAL_UINT(0, entries.size());
}

void test_near_white() {
    TEST_ASSERT_TRUE(isNearWhite(CRGB(245, 245, 245), 245));
    TEST_ASSERT_TRUE(isNearWhite(CRGB(255, 250, 246), 245));
    TEST_ASSERT_FALSE(isNearWhite(CRGB(255, 244, 255), 245));
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_detect_format_from_magic);
    RUN_TEST(test_decode_png_rgba);
    RUN_TEST(test_decode_jpeg_solid);
    RUN_TEST(test_decode_rejects_garbage);
    RUN_TEST(test_decode_rejects_truncated);
    RUN_TEST(test_composite_over_white);
    RUN_TEST(test_downscale_preserves_aspect);
    RUN_TEST(test_downscale_never_enlarges);
    RUN_TEST(test_downscale_averages_blocks);
    RUN_TEST(test_quantize_keeps_exact_colours_when_few);
    RUN_TEST(test_quantize_reduces_to_limit);
    RUN_TEST(test_quantize_empty_image);
    RUN_TEST(test_near_white);
    return UNITY_END();
}

#endif
