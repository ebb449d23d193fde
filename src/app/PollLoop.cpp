// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PollLoop.cpp
 * @brief Poll loop implementation
 */

#include "PollLoop.h"

#include <chrono>
#include <csignal>
#include <cstring>
#include <ctime>
#include <thread>

#include "pattern/PatternGenerator.h"

#define CL_LOG_TAG "Poll"
#include "utils/Log.h"

namespace coverlight {
namespace app {

namespace {

volatile sig_atomic_t s_stopRequested = 0;

void onStopSignal(int) {
    s_stopRequested = 1;
}

constexpr uint32_t SLEEP_SLICE_MS = 100;

} // namespace

std::string formatTimestamp() {
    char buf[32];
    time_t now = time(nullptr);
    struct tm local;
    if (localtime_r(&now, &local) == nullptr ||
        strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local) == 0) {
        return "1970-01-01 00:00:00";
    }
    return buf;
}

void PollLoop::installSignalHandlers() {
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onStopSignal;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGINT, &sa, nullptr) != 0 || sigaction(SIGTERM, &sa, nullptr) != 0) {
        CL_SYS_LOGW("Could not install stop signal handlers");
    }
}

void PollLoop::requestStop() {
    s_stopRequested = 1;
}

bool PollLoop::stopRequested() {
    return s_stopRequested != 0;
}

void PollLoop::clearStop() {
    s_stopRequested = 0;
}

PollLoop::PollLoop(IArtworkSource& source,
                   rotation::RotationTracker& tracker,
                   persistence::SnapshotWriter* snapshots,
                   FILE* out,
                   const PollLoopConfig& config)
    : m_source(source),
      m_tracker(tracker),
      m_snapshots(snapshots),
      m_out(out ? out : stdout),
      m_config(config) {}

bool PollLoop::runOnce() {
    ArtworkPoll poll;
    m_source.next(poll);
    if (poll.kind == PollKind::END_OF_STREAM) {
        CL_SYS_LOGI("Artwork source exhausted");
        return false;
    }

    const bool playing = (poll.kind == PollKind::IDENTIFIER);
    const std::string ts = formatTimestamp();

    codec::SnapshotData snap;
    snap.timestamp = ts;
    snap.hasArtwork = playing;
    if (playing) {
        snap.artworkIdentifier = poll.identifier;
    }

    rotation::RotationStep step = m_tracker.step(playing ? poll.identifier.c_str() : nullptr);
    snap.phase = m_tracker.state().phase;

    std::string patternText;
    if (!step.success) {
        m_stats.failures++;
        char buf[MAX_ERROR_MSG + 48];
        snprintf(buf, sizeof(buf), "(error: %s: %s)", errorKindName(step.error), step.errorMsg);
        patternText = buf;
        CL_SYS_LOGW("Cycle failed for %s: %s", poll.identifier.c_str(), step.errorMsg);
    } else if (!step.emitted) {
        m_stats.idle++;
        patternText = "(none)";
    } else {
        pattern::PatternResult generated =
            pattern::PatternGenerator::generate(step.rotatedBase, m_config.patternLength,
                                                m_config.patternMode.c_str());
        snap.hasBase = true;
        snap.basePalette = step.rotatedBase;
        if (!generated.success) {
            m_stats.failures++;
            char buf[MAX_ERROR_MSG + 48];
            snprintf(buf, sizeof(buf), "(error: %s: %s)", errorKindName(generated.error), generated.errorMsg);
            patternText = buf;
        } else {
            m_stats.emitted++;
            snap.hasPattern = true;
            snap.pattern = generated.pattern;
            for (size_t i = 0; i < generated.pattern.size(); ++i) {
                if (i > 0) {
                    patternText += ',';
                }
                patternText += generated.pattern[i].c_str();
            }
        }
    }

    fprintf(m_out, "[%s] Artwork: %s | Pattern: %s\n", ts.c_str(),
            playing ? poll.identifier.c_str() : "(none)", patternText.c_str());
    fflush(m_out);

    if (m_snapshots != nullptr) {
        persistence::SnapshotStatus status = m_snapshots->write(snap);
        if (status != persistence::SnapshotStatus::OK) {
            m_stats.snapshotErrors++;
            CL_SYS_LOGW("Snapshot not written (%s)", persistence::snapshotStatusName(status));
        }
    }

    m_lastSnapshot = snap;
    m_stats.cycles++;
    return true;
}

const PollLoopStats& PollLoop::run() {
    CL_SYS_LOGI("Polling every %u s (max loops %u)",
                static_cast<unsigned>(m_config.intervalSec), static_cast<unsigned>(m_config.maxLoops));

    while (!stopRequested()) {
        if (!runOnce()) {
            break;
        }
        if (m_config.maxLoops != 0 && m_stats.cycles >= m_config.maxLoops) {
            break;
        }
        sleepInterval();
    }

    if (stopRequested()) {
        CL_SYS_LOGI("Stop requested after %u cycle(s)", static_cast<unsigned>(m_stats.cycles));
    }
    return m_stats;
}

void PollLoop::sleepInterval() const {
    const uint64_t totalMs = static_cast<uint64_t>(m_config.intervalSec) * 1000;
    uint64_t sleptMs = 0;
    while (sleptMs < totalMs && !stopRequested()) {
        uint64_t slice = totalMs - sleptMs;
        if (slice > SLEEP_SLICE_MS) {
            slice = SLEEP_SLICE_MS;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(slice));
        sleptMs += slice;
    }
}

} // namespace app
} // namespace coverlight
