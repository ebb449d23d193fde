// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ArtworkSource.h
 * @brief Supplies the currently playing artwork identifier once per poll
 *
 * LineArtworkSource reads one line per poll from a stream:
 *   - non-blank line -> identifier (surrounding whitespace trimmed)
 *   - blank line     -> nothing playing
 *   - end of stream  -> polling ends
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

namespace coverlight {
namespace app {

enum class PollKind : uint8_t {
    IDENTIFIER = 0,
    NOTHING_PLAYING,
    END_OF_STREAM
};

struct ArtworkPoll {
    PollKind kind = PollKind::END_OF_STREAM;
    std::string identifier;
};

class IArtworkSource {
public:
    virtual ~IArtworkSource() = default;

    /**
     * @brief Produce the next poll result (blocks on the underlying stream)
     */
    virtual void next(ArtworkPoll& out) = 0;
};

class LineArtworkSource : public IArtworkSource {
public:
    /**
     * @param stream Source stream, not owned
     */
    explicit LineArtworkSource(FILE* stream);
    ~LineArtworkSource() override;

    LineArtworkSource(const LineArtworkSource&) = delete;
    LineArtworkSource& operator=(const LineArtworkSource&) = delete;

    /**
     * @brief Open a file and own the resulting stream
     * @return false if the file cannot be opened
     */
    bool open(const char* path);

    void next(ArtworkPoll& out) override;

private:
    FILE* m_stream;
    bool m_owned;
};

} // namespace app
} // namespace coverlight
