// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ImageOps.cpp
 * @brief Compositing, downscale and median-cut implementation
 */

#include "ImageOps.h"

#include <algorithm>
#include <unordered_map>

#define CL_LOG_TAG "ImageOps"
#include "utils/Log.h"

namespace coverlight {
namespace image {

namespace {

inline uint32_t packRgb(const CRGB& c) {
    return (static_cast<uint32_t>(c.r) << 16) | (static_cast<uint32_t>(c.g) << 8) | c.b;
}

inline uint8_t channelOf(uint32_t packed, int channel) {
    return static_cast<uint8_t>((packed >> (16 - 8 * channel)) & 0xFF);
}

struct ColourCount {
    uint32_t packed;
    uint32_t count;
};

struct ColourBox {
    size_t begin;
    size_t end;
    uint64_t pixels;
};

uint64_t sumPixels(const std::vector<ColourCount>& colours, size_t begin, size_t end) {
    uint64_t total = 0;
    for (size_t i = begin; i < end; ++i) {
        total += colours[i].count;
    }
    return total;
}

CRGB weightedMean(const std::vector<ColourCount>& colours, const ColourBox& box) {
    uint64_t sum[3] = { 0, 0, 0 };
    for (size_t i = box.begin; i < box.end; ++i) {
        for (int ch = 0; ch < 3; ++ch) {
            sum[ch] += static_cast<uint64_t>(channelOf(colours[i].packed, ch)) * colours[i].count;
        }
    }
    if (box.pixels == 0) {
        return CRGB(0, 0, 0);
    }
    return CRGB(static_cast<uint8_t>((sum[0] + box.pixels / 2) / box.pixels),
                static_cast<uint8_t>((sum[1] + box.pixels / 2) / box.pixels),
                static_cast<uint8_t>((sum[2] + box.pixels / 2) / box.pixels));
}

// Split boxes[index] at the weighted median of its widest channel
void splitBox(std::vector<ColourCount>& colours, std::vector<ColourBox>& boxes, size_t index) {
    const ColourBox box = boxes[index];

    uint8_t lo[3] = { 255, 255, 255 };
    uint8_t hi[3] = { 0, 0, 0 };
    for (size_t i = box.begin; i < box.end; ++i) {
        for (int ch = 0; ch < 3; ++ch) {
            uint8_t v = channelOf(colours[i].packed, ch);
            lo[ch] = std::min(lo[ch], v);
            hi[ch] = std::max(hi[ch], v);
        }
    }
    int widest = 0;
    for (int ch = 1; ch < 3; ++ch) {
        if (hi[ch] - lo[ch] > hi[widest] - lo[widest]) {
            widest = ch;
        }
    }

    std::sort(colours.begin() + box.begin, colours.begin() + box.end,
              [widest](const ColourCount& a, const ColourCount& b) {
                  uint8_t ca = channelOf(a.packed, widest);
                  uint8_t cb = channelOf(b.packed, widest);
                  if (ca != cb) {
                      return ca < cb;
                  }
                  return a.packed < b.packed;
              });

    const uint64_t half = box.pixels / 2;
    uint64_t acc = 0;
    size_t split = box.end;
    for (size_t i = box.begin; i < box.end; ++i) {
        acc += colours[i].count;
        if (acc >= half) {
            split = i + 1;
            break;
        }
    }
    // Both halves must keep at least one colour
    if (split <= box.begin) split = box.begin + 1;
    if (split >= box.end) split = box.end - 1;

    ColourBox left = { box.begin, split, sumPixels(colours, box.begin, split) };
    ColourBox right = { split, box.end, sumPixels(colours, split, box.end) };
    boxes[index] = left;
    boxes.insert(boxes.begin() + static_cast<std::ptrdiff_t>(index) + 1, right);
}

} // namespace

// ============================================================================
// Compositing
// ============================================================================

void compositeOverWhite(const RgbaImage& src, RgbImage& out) {
    out.width = src.width;
    out.height = src.height;
    out.pixels.resize(src.pixelCount());

    const CRGB white = CRGB::White;
    for (size_t i = 0; i < out.pixels.size(); ++i) {
        const uint8_t* px = &src.rgba[i * 4];
        out.pixels[i] = blend(white, CRGB(px[0], px[1], px[2]), px[3]);
    }
}

// ============================================================================
// Downscale
// ============================================================================

void downscaleToFit(const RgbImage& src, uint32_t maxDimension, RgbImage& out) {
    const uint32_t longest = std::max(src.width, src.height);
    if (maxDimension == 0 || longest <= maxDimension) {
        out = src;
        return;
    }

    const uint32_t dstW = std::max<uint32_t>(1,
        static_cast<uint32_t>((static_cast<uint64_t>(src.width) * maxDimension + longest / 2) / longest));
    const uint32_t dstH = std::max<uint32_t>(1,
        static_cast<uint32_t>((static_cast<uint64_t>(src.height) * maxDimension + longest / 2) / longest));

    out.width = dstW;
    out.height = dstH;
    out.pixels.assign(static_cast<size_t>(dstW) * dstH, CRGB(0, 0, 0));

    for (uint32_t dy = 0; dy < dstH; ++dy) {
        uint32_t y0 = static_cast<uint32_t>(static_cast<uint64_t>(dy) * src.height / dstH);
        uint32_t y1 = static_cast<uint32_t>(static_cast<uint64_t>(dy + 1) * src.height / dstH);
        if (y1 <= y0) y1 = y0 + 1;

        for (uint32_t dx = 0; dx < dstW; ++dx) {
            uint32_t x0 = static_cast<uint32_t>(static_cast<uint64_t>(dx) * src.width / dstW);
            uint32_t x1 = static_cast<uint32_t>(static_cast<uint64_t>(dx + 1) * src.width / dstW);
            if (x1 <= x0) x1 = x0 + 1;

            uint64_t sum[3] = { 0, 0, 0 };
            for (uint32_t y = y0; y < y1; ++y) {
                for (uint32_t x = x0; x < x1; ++x) {
                    const CRGB& p = src.at(x, y);
                    sum[0] += p.r;
                    sum[1] += p.g;
                    sum[2] += p.b;
                }
            }
            const uint64_t area = static_cast<uint64_t>(x1 - x0) * (y1 - y0);
            out.pixels[static_cast<size_t>(dy) * dstW + dx] =
                CRGB(static_cast<uint8_t>((sum[0] + area / 2) / area),
                     static_cast<uint8_t>((sum[1] + area / 2) / area),
                     static_cast<uint8_t>((sum[2] + area / 2) / area));
        }
    }

    CL_EXTRACT_LOGD("Downscaled %ux%u -> %ux%u",
                    static_cast<unsigned>(src.width), static_cast<unsigned>(src.height),
                    static_cast<unsigned>(dstW), static_cast<unsigned>(dstH));
}

// ============================================================================
// Median cut
// ============================================================================

void quantizeMedianCut(const RgbImage& img, uint8_t maxColours, std::vector<QuantizedEntry>& out) {
    out.clear();
    if (img.pixels.empty()) {
        return;
    }
    if (maxColours == 0) {
        maxColours = 1;
    }

    std::unordered_map<uint32_t, uint32_t> histogram;
    for (const CRGB& p : img.pixels) {
        ++histogram[packRgb(p)];
    }

    std::vector<ColourCount> colours;
    colours.reserve(histogram.size());
    for (const auto& kv : histogram) {
        colours.push_back({ kv.first, kv.second });
    }
    std::sort(colours.begin(), colours.end(),
              [](const ColourCount& a, const ColourCount& b) { return a.packed < b.packed; });

    std::vector<CRGB> entries;
    if (colours.size() <= maxColours) {
        for (const ColourCount& c : colours) {
            entries.push_back(CRGB(channelOf(c.packed, 0), channelOf(c.packed, 1), channelOf(c.packed, 2)));
        }
    } else {
        std::vector<ColourBox> boxes;
        boxes.push_back({ 0, colours.size(), sumPixels(colours, 0, colours.size()) });

        while (boxes.size() < maxColours) {
            size_t target = boxes.size();
            for (size_t i = 0; i < boxes.size(); ++i) {
                if (boxes[i].end - boxes[i].begin < 2) {
                    continue;
                }
                if (target == boxes.size() || boxes[i].pixels > boxes[target].pixels) {
                    target = i;
                }
            }
            if (target == boxes.size()) {
                break;  // every box holds a single colour
            }
            splitBox(colours, boxes, target);
        }

        for (const ColourBox& box : boxes) {
            entries.push_back(weightedMean(colours, box));
        }
    }

    std::vector<uint32_t> counts(entries.size(), 0);
    for (const ColourCount& c : colours) {
        const int r = channelOf(c.packed, 0);
        const int g = channelOf(c.packed, 1);
        const int b = channelOf(c.packed, 2);
        size_t best = 0;
        int32_t bestDist = INT32_MAX;
        for (size_t e = 0; e < entries.size(); ++e) {
            const int dr = r - entries[e].r;
            const int dg = g - entries[e].g;
            const int db = b - entries[e].b;
            const int32_t dist = dr * dr + dg * dg + db * db;
            if (dist < bestDist) {
                bestDist = dist;
                best = e;
            }
        }
        counts[best] += c.count;
    }

    for (size_t e = 0; e < entries.size(); ++e) {
        if (counts[e] == 0) {
            continue;
        }
        QuantizedEntry entry;
        entry.colour = entries[e];
        entry.count = counts[e];
        out.push_back(entry);
        CL_EXTRACT_LOGT("Entry %zu: #%02X%02X%02X x%u", e,
                        entries[e].r, entries[e].g, entries[e].b, static_cast<unsigned>(counts[e]));
    }
}

} // namespace image
} // namespace coverlight
