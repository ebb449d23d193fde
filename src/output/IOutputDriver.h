// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IOutputDriver.h
 * @brief Abstraction for pattern sinks
 *
 * A driver receives complete patterns, one per send(). The only shipped
 * implementation is ConsoleOutputDriver; LED strip or network drivers plug
 * in behind the same three calls.
 */

#pragma once

#include <cstdint>

#include "core/CoverTypes.h"

namespace coverlight {
namespace output {

/**
 * @brief Output driver statistics
 */
struct OutputDriverStats {
    uint32_t patternsSent = 0;      ///< Successful send() calls
    uint32_t coloursSent = 0;       ///< Total colours across all patterns
    uint32_t lastLength = 0;        ///< Length of the most recent pattern
};

/**
 * @brief Abstract interface for pattern output
 */
class IOutputDriver {
public:
    virtual ~IOutputDriver() = default;

    /**
     * @brief Open the sink
     * @return true if the driver is ready for send()
     */
    virtual bool connect() = 0;

    /**
     * @brief Deliver one pattern synchronously
     * @param pattern Colours in output order
     * @return false if not connected or the sink rejected the write
     */
    virtual bool send(const Pattern& pattern) = 0;

    /**
     * @brief Release the sink (safe to call when not connected)
     */
    virtual void close() = 0;

    /**
     * @brief Check if connect() succeeded and close() has not been called
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Get driver statistics
     */
    virtual const OutputDriverStats& getStats() const = 0;
};

} // namespace output
} // namespace coverlight
