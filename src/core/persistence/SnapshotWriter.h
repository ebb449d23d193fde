// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SnapshotWriter.h
 * @brief Atomic snapshot file persistence
 *
 * Serializes a SnapshotData through SnapshotCodec and replaces the target
 * file atomically (write "<path>.tmp", then rename). The parent directory is
 * created on first use.
 */

#pragma once

#include <cstdint>
#include <string>

#include "codec/SnapshotCodec.h"

namespace coverlight {
namespace persistence {

/**
 * @brief Result codes for snapshot operations
 */
enum class SnapshotStatus : uint8_t {
    OK = 0,
    DIRECTORY_ERROR,        ///< Parent directory could not be created
    SERIALIZE_ERROR,        ///< JSON serialization produced no output
    WRITE_ERROR,            ///< Temp write or rename failed
    READ_ERROR,             ///< File missing or unreadable
    PARSE_ERROR             ///< File content rejected by the codec
};

const char* snapshotStatusName(SnapshotStatus status);

class SnapshotWriter {
public:
    explicit SnapshotWriter(const std::string& path);

    /**
     * @brief Replace the snapshot file with data
     */
    SnapshotStatus write(const codec::SnapshotData& data);

    /**
     * @brief Read back and decode the current snapshot file
     */
    SnapshotStatus read(codec::SnapshotData& out) const;

    const std::string& path() const { return m_path; }
    uint32_t writeCount() const { return m_writeCount; }

private:
    std::string m_path;
    uint32_t m_writeCount;
};

} // namespace persistence
} // namespace coverlight
