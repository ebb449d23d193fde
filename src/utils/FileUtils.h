// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FileUtils.h
 * @brief Small POSIX file helpers shared by the cache, snapshot and config code
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace coverlight {
namespace utils {

/**
 * @brief Create a directory and any missing parents (mkdir -p)
 * @return true if the directory exists afterwards
 */
bool ensureDirectory(const char* path);

/**
 * @brief Read an open stream from its current position to EOF
 */
bool readStream(FILE* stream, std::vector<uint8_t>& out);

/**
 * @brief Read a whole file into memory
 */
bool readFile(const char* path, std::vector<uint8_t>& out);

/**
 * @brief Write data to path via "<path>.tmp" and rename
 *
 * Readers never observe a partially written file.
 */
bool writeFileAtomic(const char* path, const char* data, size_t length);

/**
 * @brief Directory part of path ("" when path has no separator)
 */
std::string parentDirectory(const char* path);

/**
 * @brief True if path names an existing filesystem entry
 */
bool pathExists(const char* path);

} // namespace utils
} // namespace coverlight
