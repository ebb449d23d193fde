// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ArtworkSource.cpp
 * @brief Line-oriented artwork source
 */

#include "ArtworkSource.h"

#include <cctype>
#include <cerrno>
#include <cstring>

#define CL_LOG_TAG "Source"
#include "utils/Log.h"

namespace coverlight {
namespace app {

LineArtworkSource::LineArtworkSource(FILE* stream)
    : m_stream(stream), m_owned(false) {}

LineArtworkSource::~LineArtworkSource() {
    if (m_owned && m_stream != nullptr) {
        fclose(m_stream);
    }
}

bool LineArtworkSource::open(const char* path) {
    FILE* f = fopen(path, "rb");
    if (f == nullptr) {
        CL_SYS_LOGE("Cannot open %s: %s", path, strerror(errno));
        return false;
    }
    if (m_owned && m_stream != nullptr) {
        fclose(m_stream);
    }
    m_stream = f;
    m_owned = true;
    return true;
}

void LineArtworkSource::next(ArtworkPoll& out) {
    out.identifier.clear();
    out.kind = PollKind::END_OF_STREAM;
    if (m_stream == nullptr) {
        return;
    }

    std::string line;
    bool gotAny = false;
    int ch;
    while ((ch = fgetc(m_stream)) != EOF) {
        gotAny = true;
        if (ch == '\n') {
            break;
        }
        line += static_cast<char>(ch);
    }
    if (!gotAny) {
        return;
    }

    size_t begin = 0;
    size_t end = line.size();
    while (begin < end && isspace(static_cast<unsigned char>(line[begin]))) ++begin;
    while (end > begin && isspace(static_cast<unsigned char>(line[end - 1]))) --end;

    if (begin == end) {
        out.kind = PollKind::NOTHING_PLAYING;
        return;
    }
    out.kind = PollKind::IDENTIFIER;
    out.identifier.assign(line, begin, end - begin);
}

} // namespace app
} // namespace coverlight
