// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file TempArtifact.h
 * @brief Scoped temporary file for downloaded artwork
 *
 * The file is created in the cache directory with a unique name and removed
 * when the TempArtifact goes out of scope, on every exit path. Removal
 * failures are logged and otherwise ignored so cleanup never masks the
 * caller's own result.
 *
 * Example:
 * @code
 * TempArtifact artifact;
 * if (!artifact.create("cache", ".jpg")) { ... }
 * fetcher.fetch(url, artifact.stream());
 * artifact.rewind();
 * utils::readStream(artifact.stream(), bytes);
 * // file is unlinked here
 * @endcode
 */

#pragma once

#include <cstdio>
#include <string>

namespace coverlight {
namespace net {

class TempArtifact {
public:
    TempArtifact();
    ~TempArtifact();

    // Non-copyable, non-movable
    TempArtifact(const TempArtifact&) = delete;
    TempArtifact& operator=(const TempArtifact&) = delete;
    TempArtifact(TempArtifact&&) = delete;
    TempArtifact& operator=(TempArtifact&&) = delete;

    /**
     * @brief Create and open "<dir>/artwork-XXXXXX<suffix>"
     * @param dir Directory, created if missing
     * @param suffix Extension including the dot (may be empty)
     * @return false if the directory or file could not be created
     */
    bool create(const char* dir, const char* suffix);

    /**
     * @brief Flush pending writes and seek back to the start for reading
     */
    bool rewind();

    /**
     * @brief Close the stream and unlink the file now (idempotent)
     */
    void release();

    FILE* stream() const { return m_stream; }
    const std::string& path() const { return m_path; }
    bool isOpen() const { return m_stream != nullptr; }

private:
    FILE* m_stream;
    std::string m_path;
};

/**
 * @brief Extension to use for a locator's temp file
 *
 * The locator path's extension when it is 2-6 characters long (".jpg",
 * ".png"), otherwise ".jpg". Query strings and fragments are ignored.
 */
std::string artifactSuffixFor(const char* locator);

} // namespace net
} // namespace coverlight
