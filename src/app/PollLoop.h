// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PollLoop.h
 * @brief Drives the rotation tracker from an artwork source
 *
 * Per cycle:
 *   1. Read one poll from the source (end of stream stops the loop)
 *   2. RotationTracker::step()
 *   3. Generate the pattern from the rotated base
 *   4. Print "[ts] Artwork: <id> | Pattern: c1,c2,..." (or the error)
 *   5. Write the snapshot (failures logged, never fatal)
 *   6. Stop on maxLoops or a pending stop request, else sleep intervalSec
 *
 * Stop requests come from SIGINT / SIGTERM once installSignalHandlers() has
 * run, or from requestStop(). Sleeping wakes early when one arrives.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

#include "ArtworkSource.h"
#include "config/defaults.h"
#include "codec/SnapshotCodec.h"
#include "core/persistence/SnapshotWriter.h"
#include "rotation/RotationTracker.h"

namespace coverlight {
namespace app {

struct PollLoopConfig {
    uint32_t intervalSec = config::PollDefaults::INTERVAL_SEC;
    uint32_t maxLoops = config::PollDefaults::MAX_LOOPS;   ///< 0 = unlimited
    size_t patternLength = config::PatternDefaults::LENGTH;
    std::string patternMode = config::PatternDefaults::MODE;
};

struct PollLoopStats {
    uint32_t cycles = 0;
    uint32_t emitted = 0;           ///< Cycles that produced a pattern
    uint32_t idle = 0;              ///< Nothing-playing cycles
    uint32_t failures = 0;          ///< Extraction or generation failures
    uint32_t snapshotErrors = 0;
};

class PollLoop {
public:
    /**
     * @param source Poll source
     * @param tracker Rotation state owner for this loop
     * @param snapshots Snapshot writer, nullptr to disable snapshots
     * @param out Cycle lines destination, stdout when nullptr
     * @param config Loop settings
     */
    PollLoop(IArtworkSource& source,
             rotation::RotationTracker& tracker,
             persistence::SnapshotWriter* snapshots,
             FILE* out,
             const PollLoopConfig& config);

    /**
     * @brief Run until end of stream, maxLoops, or a stop request
     */
    const PollLoopStats& run();

    /**
     * @brief Execute a single cycle without sleeping
     * @return false when the source reached end of stream
     */
    bool runOnce();

    const PollLoopStats& getStats() const { return m_stats; }
    const codec::SnapshotData& lastSnapshot() const { return m_lastSnapshot; }

    static void installSignalHandlers();
    static void requestStop();
    static bool stopRequested();
    static void clearStop();

private:
    void sleepInterval() const;

    IArtworkSource& m_source;
    rotation::RotationTracker& m_tracker;
    persistence::SnapshotWriter* m_snapshots;
    FILE* m_out;
    PollLoopConfig m_config;
    PollLoopStats m_stats;
    codec::SnapshotData m_lastSnapshot;
};

/**
 * @brief Local time as "YYYY-MM-DD HH:MM:SS"
 */
std::string formatTimestamp();

} // namespace app
} // namespace coverlight
