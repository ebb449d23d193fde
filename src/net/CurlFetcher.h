// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file CurlFetcher.h
 * @brief libcurl-backed IResourceFetcher
 *
 * Supports http://, https:// (redirects followed) and file://. HTTP
 * transfers succeed only on 2xx. The whole transfer is bounded by
 * timeoutMs and fails fast on timeout.
 */

#pragma once

#include "IResourceFetcher.h"
#include "config/defaults.h"

#include <cstdint>
#include <string>

namespace coverlight {
namespace net {

struct CurlFetcherConfig {
    uint32_t timeoutMs = config::NetworkDefaults::FETCH_TIMEOUT_MS;
    uint32_t connectTimeoutMs = config::NetworkDefaults::CONNECT_TIMEOUT_MS;
    std::string userAgent = config::NetworkDefaults::USER_AGENT;
    long maxRedirects = 5;
};

class CurlFetcher : public IResourceFetcher {
public:
    explicit CurlFetcher(const CurlFetcherConfig& config);
    ~CurlFetcher() override;

    CurlFetcher(const CurlFetcher&) = delete;
    CurlFetcher& operator=(const CurlFetcher&) = delete;

    FetchResult fetch(const char* locator, FILE* sink) override;

    const CurlFetcherConfig& getConfig() const { return m_config; }

private:
    CurlFetcherConfig m_config;
    bool m_globalReady;
};

} // namespace net
} // namespace coverlight
