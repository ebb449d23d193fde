// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FileUtils.cpp
 * @brief POSIX file helper implementation
 */

#include "FileUtils.h"

#include <cerrno>
#include <cstring>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#define CL_LOG_TAG "Files"
#include "utils/Log.h"

namespace coverlight {
namespace utils {

bool pathExists(const char* path) {
    struct stat st;
    return path != nullptr && stat(path, &st) == 0;
}

bool ensureDirectory(const char* path) {
    if (path == nullptr || path[0] == '\0') {
        return false;
    }

    std::string partial;
    partial.reserve(strlen(path));
    for (const char* p = path; ; ++p) {
        if (*p == '/' || *p == '\0') {
            if (!partial.empty() && partial != "/" && partial != ".") {
                if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
                    CL_LOGE("mkdir %s failed: %s", partial.c_str(), strerror(errno));
                    return false;
                }
            }
            if (*p == '\0') {
                break;
            }
        }
        partial.push_back(*p);
    }

    struct stat st;
    if (stat(path, &st) != 0 || !S_ISDIR(st.st_mode)) {
        CL_LOGE("%s is not a directory", path);
        return false;
    }
    return true;
}

bool readStream(FILE* stream, std::vector<uint8_t>& out) {
    out.clear();
    if (stream == nullptr) {
        return false;
    }
    uint8_t buf[8192];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), stream)) > 0) {
        out.insert(out.end(), buf, buf + n);
    }
    return ferror(stream) == 0;
}

bool readFile(const char* path, std::vector<uint8_t>& out) {
    FILE* f = fopen(path, "rb");
    if (f == nullptr) {
        CL_LOGW("Cannot open %s: %s", path, strerror(errno));
        return false;
    }
    bool ok = readStream(f, out);
    fclose(f);
    return ok;
}

bool writeFileAtomic(const char* path, const char* data, size_t length) {
    std::string tmpPath(path);
    tmpPath += ".tmp";

    FILE* f = fopen(tmpPath.c_str(), "wb");
    if (f == nullptr) {
        CL_LOGW("Cannot create %s: %s", tmpPath.c_str(), strerror(errno));
        return false;
    }
    bool ok = fwrite(data, 1, length, f) == length;
    if (fclose(f) != 0) {
        ok = false;
    }
    if (!ok) {
        CL_LOGW("Write to %s failed", tmpPath.c_str());
        unlink(tmpPath.c_str());
        return false;
    }
    if (rename(tmpPath.c_str(), path) != 0) {
        CL_LOGW("Rename %s -> %s failed: %s", tmpPath.c_str(), path, strerror(errno));
        unlink(tmpPath.c_str());
        return false;
    }
    return true;
}

std::string parentDirectory(const char* path) {
    if (path == nullptr) {
        return std::string();
    }
    const char* slash = strrchr(path, '/');
    if (slash == nullptr) {
        return std::string();
    }
    if (slash == path) {
        return std::string("/");
    }
    return std::string(path, static_cast<size_t>(slash - path));
}

} // namespace utils
} // namespace coverlight
