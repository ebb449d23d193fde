// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConsoleOutputDriver.h
 * @brief IOutputDriver that prints patterns as text
 *
 * Output (one line each):
 *   [console] connected
 *   #7E563D,#33047D,...
 *   [console] closed
 *
 * With swatches enabled every colour is preceded by a two-cell 24-bit
 * ANSI background block.
 */

#pragma once

#include "IOutputDriver.h"

#include <cstdio>

namespace coverlight {
namespace output {

class ConsoleOutputDriver : public IOutputDriver {
public:
    /**
     * @param stream Destination, stdout when nullptr
     * @param swatches Prefix each colour with an ANSI truecolour block
     */
    explicit ConsoleOutputDriver(FILE* stream = nullptr, bool swatches = false);
    ~ConsoleOutputDriver() override;

    bool connect() override;
    bool send(const Pattern& pattern) override;
    void close() override;
    bool isConnected() const override { return m_connected; }
    const OutputDriverStats& getStats() const override { return m_stats; }

private:
    FILE* m_stream;
    bool m_swatches;
    bool m_connected;
    OutputDriverStats m_stats;
};

} // namespace output
} // namespace coverlight
