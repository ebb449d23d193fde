// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SnapshotWriter.cpp
 * @brief Snapshot persistence implementation
 */

#include "SnapshotWriter.h"

#include <vector>

#include <ArduinoJson.h>

#include "utils/FileUtils.h"

#define CL_LOG_TAG "Snapshot"
#include "utils/Log.h"

namespace coverlight {
namespace persistence {

const char* snapshotStatusName(SnapshotStatus status) {
    switch (status) {
        case SnapshotStatus::OK:              return "OK";
        case SnapshotStatus::DIRECTORY_ERROR: return "DIRECTORY_ERROR";
        case SnapshotStatus::SERIALIZE_ERROR: return "SERIALIZE_ERROR";
        case SnapshotStatus::WRITE_ERROR:     return "WRITE_ERROR";
        case SnapshotStatus::READ_ERROR:      return "READ_ERROR";
        case SnapshotStatus::PARSE_ERROR:     return "PARSE_ERROR";
        default:                              return "UNKNOWN";
    }
}

SnapshotWriter::SnapshotWriter(const std::string& path)
    : m_path(path), m_writeCount(0) {}

SnapshotStatus SnapshotWriter::write(const codec::SnapshotData& data) {
    std::string dir = utils::parentDirectory(m_path.c_str());
    if (!dir.empty() && !utils::ensureDirectory(dir.c_str())) {
        CL_SYS_LOGE("Snapshot directory unavailable: %s", dir.c_str());
        return SnapshotStatus::DIRECTORY_ERROR;
    }

    JsonDocument doc;
    JsonObject root = doc.to<JsonObject>();
    codec::SnapshotCodec::encode(data, root);

    std::string text;
    if (serializeJsonPretty(doc, text) == 0) {
        CL_SYS_LOGE("Snapshot serialization failed");
        return SnapshotStatus::SERIALIZE_ERROR;
    }
    text += '\n';

    if (!utils::writeFileAtomic(m_path.c_str(), text.data(), text.size())) {
        CL_SYS_LOGE("Snapshot write failed: %s", m_path.c_str());
        return SnapshotStatus::WRITE_ERROR;
    }

    m_writeCount++;
    CL_SYS_LOGD("Snapshot written to %s (%zu bytes)", m_path.c_str(), text.size());
    return SnapshotStatus::OK;
}

SnapshotStatus SnapshotWriter::read(codec::SnapshotData& out) const {
    std::vector<uint8_t> bytes;
    if (!utils::readFile(m_path.c_str(), bytes)) {
        return SnapshotStatus::READ_ERROR;
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, reinterpret_cast<const char*>(bytes.data()), bytes.size());
    if (err || !doc.is<JsonObject>()) {
        CL_SYS_LOGW("Snapshot %s is not a JSON object", m_path.c_str());
        return SnapshotStatus::PARSE_ERROR;
    }

    codec::SnapshotDecodeResult decoded = codec::SnapshotCodec::decode(doc.as<JsonObjectConst>());
    if (!decoded.success) {
        CL_SYS_LOGW("Snapshot %s rejected: %s", m_path.c_str(), decoded.errorMsg);
        return SnapshotStatus::PARSE_ERROR;
    }

    out = decoded.snapshot;
    return SnapshotStatus::OK;
}

} // namespace persistence
} // namespace coverlight
