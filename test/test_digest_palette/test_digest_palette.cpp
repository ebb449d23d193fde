/**
 * @file test_digest_palette.cpp
 * @brief Unit tests for the MD5 digest palette and ColourHex formatting
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include <cctype>
#include <cstring>
#include "../../src/palette/DigestPalette.h"
#include "../../src/palette/PaletteExtractor.h"

using namespace coverlight;
using namespace coverlight::palette;

// Extractor whose fetcher must never be reached
class UnreachableFetcher : public net::IResourceFetcher {
public:
    int calls = 0;
    net::FetchResult fetch(const char*, FILE*) override {
        calls++;
        net::FetchResult r;
        r.status = net::FetchStatus::NETWORK_ERROR;
        snprintf(r.errorMsg, MAX_ERROR_MSG, "unexpected fetch");
        return r;
    }
};

static void assertPalette(const char* const expected[4], const Palette& p) {
    for (size_t i = 0; i < PALETTE_SIZE; ++i) {
        TEST_ASSERT_EQUAL_STRING(expected[i], p[i].c_str());
    }
}

static void assertHexFormat(const ColourHex& c) {
    const char* s = c.c_str();
    TEST_ASSERT_EQUAL_UINT(7, strlen(s));
    TEST_ASSERT_EQUAL_INT('#', s[0]);
    for (size_t i = 1; i < 7; ++i) {
        TEST_ASSERT_TRUE(isdigit(static_cast<unsigned char>(s[i])) || (s[i] >= 'A' && s[i] <= 'F'));
    }
}

void setUp(void) {}
void tearDown(void) {}

void test_empty_identifier_digest() {
    static const char* const expected[4] = {"#D41D8C", "#D98F00", "#B204E9", "#800998"};
    Palette p;
    TEST_ASSERT_TRUE(digestPalette("", p));
    assertPalette(expected, p);

    Palette fromNull;
    TEST_ASSERT_TRUE(digestPalette(static_cast<const char*>(nullptr), fromNull));
    assertPalette(expected, fromNull);
}

void test_album_uri_digest() {
    static const char* const expected[4] = {"#7E563D", "#33047D", "#F5CDA2", "#E96F69"};
    Palette p;
    TEST_ASSERT_TRUE(digestPalette("spotify:album:4aawyAB9vmqN3uQ7FjRGTy", p));
    assertPalette(expected, p);
}

void test_distinct_identifiers_distinct_palettes() {
    static const char* const expectedA[4] = {"#93D82F", "#22195B", "#73DFFF", "#178B2E"};
    static const char* const expectedB[4] = {"#67E578", "#5EBC04", "#C32220", "#3BCC67"};
    Palette a;
    Palette b;
    TEST_ASSERT_TRUE(digestPalette("track-A", a));
    TEST_ASSERT_TRUE(digestPalette("track-B", b));
    assertPalette(expectedA, a);
    assertPalette(expectedB, b);
}

void test_byte_and_string_overloads_agree() {
    const char* text = "track-A";
    Palette fromText;
    Palette fromBytes;
    TEST_ASSERT_TRUE(digestPalette(text, fromText));
    TEST_ASSERT_TRUE(digestPalette(reinterpret_cast<const uint8_t*>(text), strlen(text), fromBytes));
    TEST_ASSERT_TRUE(fromText == fromBytes);
}

void test_slicing_wraps_digest() {
    uint8_t digest[DIGEST_LENGTH];
    for (size_t i = 0; i < DIGEST_LENGTH; ++i) {
        digest[i] = static_cast<uint8_t>(i * 0x11);
    }
    Palette p = paletteFromDigest(digest, DIGEST_LENGTH);
    TEST_ASSERT_EQUAL_STRING("#001122", p[0].c_str());
    TEST_ASSERT_EQUAL_STRING("#334455", p[1].c_str());
    TEST_ASSERT_EQUAL_STRING("#667788", p[2].c_str());
    TEST_ASSERT_EQUAL_STRING("#99AABB", p[3].c_str());
}

void test_extractor_digest_mode_never_fetches() {
    UnreachableFetcher fetcher;
    ExtractOptions opts;
    PaletteExtractor extractor(fetcher, opts);

    const char* ids[] = {"", "spotify:album:4aawyAB9vmqN3uQ7FjRGTy", "ftp://example.com/a.jpg", "HTTP://UPPER"};
    for (size_t i = 0; i < sizeof(ids) / sizeof(ids[0]); ++i) {
        ExtractResult first = extractor.extract(ids[i]);
        ExtractResult second = extractor.extract(ids[i]);
        TEST_ASSERT_TRUE(first.success);
        TEST_ASSERT_EQUAL(static_cast<int>(ExtractMode::DIGEST), static_cast<int>(first.mode));
        TEST_ASSERT_TRUE(first.palette == second.palette);
        for (size_t c = 0; c < PALETTE_SIZE; ++c) {
            assertHexFormat(first.palette[c]);
        }
    }
    TEST_ASSERT_EQUAL_INT(0, fetcher.calls);
}

void test_fetchable_classification() {
    TEST_ASSERT_TRUE(PaletteExtractor::isFetchable("http://example.com/a.jpg"));
    TEST_ASSERT_TRUE(PaletteExtractor::isFetchable("https://example.com/a.jpg"));
    TEST_ASSERT_TRUE(PaletteExtractor::isFetchable("file:///tmp/a.png"));
    TEST_ASSERT_FALSE(PaletteExtractor::isFetchable(""));
    TEST_ASSERT_FALSE(PaletteExtractor::isFetchable(nullptr));
    TEST_ASSERT_FALSE(PaletteExtractor::isFetchable("spotify:album:x"));
    TEST_ASSERT_FALSE(PaletteExtractor::isFetchable("https:/missing-slash"));
}

void test_colour_hex_parse_canonicalises() {
    ColourHex c;
    TEST_ASSERT_TRUE(ColourHex::parse("#aabbcc", c));
    TEST_ASSERT_EQUAL_STRING("#AABBCC", c.c_str());
    TEST_ASSERT_EQUAL_UINT8(0xAA, c.rgb().r);
    TEST_ASSERT_EQUAL_UINT8(0xCC, c.rgb().b);

    ColourHex untouched(1, 2, 3);
    TEST_ASSERT_FALSE(ColourHex::parse("AABBCC", untouched));
    TEST_ASSERT_FALSE(ColourHex::parse("#AABBC", untouched));
    TEST_ASSERT_FALSE(ColourHex::parse("#AABBCCD", untouched));
    TEST_ASSERT_FALSE(ColourHex::parse("#GGBBCC", untouched));
    TEST_ASSERT_FALSE(ColourHex::parse(nullptr, untouched));
    TEST_ASSERT_EQUAL_STRING("#010203", untouched.c_str());
}

void test_rotate_palette() {
    Palette base;
    TEST_ASSERT_TRUE(digestPalette("track-A", base));
    Palette r2 = rotatePalette(base, 2);
    TEST_ASSERT_TRUE(r2[0] == base[2]);
    TEST_ASSERT_TRUE(r2[1] == base[3]);
    TEST_ASSERT_TRUE(r2[2] == base[0]);
    TEST_ASSERT_TRUE(r2[3] == base[1]);
    TEST_ASSERT_TRUE(rotatePalette(base, 4) == base);
    TEST_ASSERT_TRUE(rotatePalette(base, 0) == base);
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_empty_identifier_digest);
    RUN_TEST(test_album_uri_digest);
    RUN_TEST(test_distinct_identifiers_distinct_palettes);
    RUN_TEST(test_byte_and_string_overloads_agree);
    RUN_TEST(test_slicing_wraps_digest);
    RUN_TEST(test_extractor_digest_mode_never_fetches);
    RUN_TEST(test_fetchable_classification);
    RUN_TEST(test_colour_hex_parse_canonicalises);
    RUN_TEST(test_rotate_palette);
    return UNITY_END();
}

#endif
