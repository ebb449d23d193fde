// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IResourceFetcher.h
 * @brief Retrieval abstraction for artwork locators
 *
 * Implementations:
 * - CurlFetcher: http://, https:// and file:// through libcurl
 * - Test fakes that serve canned bytes or failures
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>

#include "core/CoverTypes.h"

namespace coverlight {
namespace net {

/**
 * @brief Result of a fetch operation
 */
enum class FetchStatus : uint8_t {
    OK = 0,
    INVALID_LOCATOR,    ///< Empty or unsupported locator
    NETWORK_ERROR,      ///< Connection, DNS, TLS or unreadable file
    HTTP_STATUS,        ///< Server answered outside 2xx
    TIMEOUT,            ///< Exceeded the configured timeout
    IO_ERROR            ///< Writing to the sink failed
};

const char* fetchStatusName(FetchStatus status);

struct FetchResult {
    bool success;
    FetchStatus status;
    long httpStatus;        ///< 0 when not an HTTP transfer
    size_t bytesWritten;
    char errorMsg[MAX_ERROR_MSG];

    FetchResult() : success(false), status(FetchStatus::INVALID_LOCATOR), httpStatus(0), bytesWritten(0) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

/**
 * @brief Abstract interface for resource retrieval
 */
class IResourceFetcher {
public:
    virtual ~IResourceFetcher() = default;

    /**
     * @brief Retrieve locator and append its bytes to sink
     *
     * Blocks until complete, failed, or timed out. Never retries.
     *
     * @param locator Fetchable locator (scheme://...)
     * @param sink Open, writable stream
     * @return Fetch result
     */
    virtual FetchResult fetch(const char* locator, FILE* sink) = 0;
};

} // namespace net
} // namespace coverlight
