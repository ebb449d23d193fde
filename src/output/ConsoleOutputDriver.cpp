// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConsoleOutputDriver.cpp
 * @brief Text output driver
 */

#include "ConsoleOutputDriver.h"

#define CL_LOG_TAG "Console"
#include "utils/Log.h"

namespace coverlight {
namespace output {

ConsoleOutputDriver::ConsoleOutputDriver(FILE* stream, bool swatches)
    : m_stream(stream ? stream : stdout), m_swatches(swatches), m_connected(false) {}

ConsoleOutputDriver::~ConsoleOutputDriver() {
    close();
}

bool ConsoleOutputDriver::connect() {
    if (m_connected) {
        return true;
    }
    if (fprintf(m_stream, "[console] connected\n") < 0) {
        CL_SYS_LOGE("Console stream not writable");
        return false;
    }
    m_connected = true;
    return true;
}

bool ConsoleOutputDriver::send(const Pattern& pattern) {
    if (!m_connected) {
        CL_SYS_LOGW("send() before connect()");
        return false;
    }

    for (size_t i = 0; i < pattern.size(); ++i) {
        if (i > 0) {
            fputc(',', m_stream);
        }
        if (m_swatches) {
            CRGB c = pattern[i].rgb();
            fprintf(m_stream, "\033[48;2;%u;%u;%um  \033[0m",
                    static_cast<unsigned>(c.r), static_cast<unsigned>(c.g), static_cast<unsigned>(c.b));
        }
        fputs(pattern[i].c_str(), m_stream);
    }
    fputc('\n', m_stream);

    if (fflush(m_stream) != 0 || ferror(m_stream)) {
        CL_SYS_LOGE("Writing pattern failed");
        return false;
    }

    m_stats.patternsSent++;
    m_stats.coloursSent += static_cast<uint32_t>(pattern.size());
    m_stats.lastLength = static_cast<uint32_t>(pattern.size());
    return true;
}

void ConsoleOutputDriver::close() {
    if (!m_connected) {
        return;
    }
    fprintf(m_stream, "[console] closed\n");
    fflush(m_stream);
    m_connected = false;
}

} // namespace output
} // namespace coverlight
