// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file TempArtifact.cpp
 * @brief Scoped temporary file implementation
 */

#include "TempArtifact.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <unistd.h>

#include "utils/FileUtils.h"

#define CL_LOG_TAG "TempArtifact"
#include "utils/Log.h"

namespace coverlight {
namespace net {

TempArtifact::TempArtifact() : m_stream(nullptr) {}

TempArtifact::~TempArtifact() {
    release();
}

bool TempArtifact::create(const char* dir, const char* suffix) {
    release();

    if (!utils::ensureDirectory(dir)) {
        CL_NET_LOGE("Cache directory unavailable: %s", dir);
        return false;
    }
    if (suffix == nullptr) {
        suffix = "";
    }

    std::string pattern(dir);
    if (!pattern.empty() && pattern.back() != '/') {
        pattern += '/';
    }
    pattern += "artwork-XXXXXX";
    pattern += suffix;

    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = mkstemps(name.data(), static_cast<int>(strlen(suffix)));
    if (fd < 0) {
        CL_NET_LOGE("mkstemps(%s) failed: %s", pattern.c_str(), strerror(errno));
        return false;
    }
    m_path.assign(name.data());

    m_stream = fdopen(fd, "w+b");
    if (m_stream == nullptr) {
        CL_NET_LOGE("fdopen(%s) failed: %s", m_path.c_str(), strerror(errno));
        close(fd);
        release();
        return false;
    }

    CL_NET_LOGD("Created %s", m_path.c_str());
    return true;
}

bool TempArtifact::rewind() {
    if (m_stream == nullptr) {
        return false;
    }
    if (fflush(m_stream) != 0) {
        return false;
    }
    return fseek(m_stream, 0, SEEK_SET) == 0;
}

void TempArtifact::release() {
    if (m_stream != nullptr) {
        if (fclose(m_stream) != 0) {
            CL_NET_LOGW("Closing %s failed: %s", m_path.c_str(), strerror(errno));
        }
        m_stream = nullptr;
    }
    if (!m_path.empty()) {
        if (unlink(m_path.c_str()) == 0) {
            CL_NET_LOGD("Removed %s", m_path.c_str());
        } else if (errno != ENOENT) {
            CL_NET_LOGW("Could not remove %s: %s", m_path.c_str(), strerror(errno));
        }
        m_path.clear();
    }
}

std::string artifactSuffixFor(const char* locator) {
    static const char* DEFAULT_SUFFIX = ".jpg";
    if (locator == nullptr) {
        return DEFAULT_SUFFIX;
    }

    size_t end = strcspn(locator, "?#");
    std::string path(locator, end);

    size_t slash = path.rfind('/');
    size_t dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return DEFAULT_SUFFIX;
    }

    std::string ext = path.substr(dot);
    if (ext.size() < 2 || ext.size() > 6) {
        return DEFAULT_SUFFIX;
    }
    for (size_t i = 1; i < ext.size(); ++i) {
        if (!isalnum(static_cast<unsigned char>(ext[i]))) {
            return DEFAULT_SUFFIX;
        }
    }
    return ext;
}

} // namespace net
} // namespace coverlight
