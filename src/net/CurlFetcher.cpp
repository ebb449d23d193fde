// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file CurlFetcher.cpp
 * @brief libcurl fetch implementation
 */

#include "CurlFetcher.h"

#include <curl/curl.h>

#define CL_LOG_TAG "Fetch"
#include "utils/Log.h"

namespace coverlight {
namespace net {

namespace {

struct WriteContext {
    FILE* sink;
    size_t bytesWritten;
    bool writeFailed;
};

size_t writeToSink(char* ptr, size_t size, size_t nmemb, void* userdata) {
    WriteContext* ctx = static_cast<WriteContext*>(userdata);
    const size_t total = size * nmemb;
    if (total == 0) {
        return 0;
    }
    const size_t written = fwrite(ptr, 1, total, ctx->sink);
    ctx->bytesWritten += written;
    if (written != total) {
        ctx->writeFailed = true;
    }
    // A short count makes libcurl abort with CURLE_WRITE_ERROR
    return written;
}

bool isHttpLocator(const char* locator) {
    return strncmp(locator, "http://", 7) == 0 || strncmp(locator, "https://", 8) == 0;
}

} // namespace

const char* fetchStatusName(FetchStatus status) {
    switch (status) {
        case FetchStatus::OK:              return "OK";
        case FetchStatus::INVALID_LOCATOR: return "INVALID_LOCATOR";
        case FetchStatus::NETWORK_ERROR:   return "NETWORK_ERROR";
        case FetchStatus::HTTP_STATUS:     return "HTTP_STATUS";
        case FetchStatus::TIMEOUT:         return "TIMEOUT";
        case FetchStatus::IO_ERROR:        return "IO_ERROR";
        default:                           return "UNKNOWN";
    }
}

CurlFetcher::CurlFetcher(const CurlFetcherConfig& config)
    : m_config(config), m_globalReady(false) {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        CL_NET_LOGE("curl_global_init failed: %s", curl_easy_strerror(rc));
        return;
    }
    m_globalReady = true;
}

CurlFetcher::~CurlFetcher() {
    if (m_globalReady) {
        curl_global_cleanup();
    }
}

FetchResult CurlFetcher::fetch(const char* locator, FILE* sink) {
    FetchResult result;

    if (locator == nullptr || locator[0] == '\0') {
        result.status = FetchStatus::INVALID_LOCATOR;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Empty locator");
        return result;
    }
    if (sink == nullptr) {
        result.status = FetchStatus::IO_ERROR;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "No output stream");
        return result;
    }
    if (!m_globalReady) {
        result.status = FetchStatus::NETWORK_ERROR;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "libcurl not initialized");
        return result;
    }

    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        result.status = FetchStatus::NETWORK_ERROR;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "curl_easy_init failed");
        return result;
    }

    WriteContext ctx = { sink, 0, false };
    char curlError[CURL_ERROR_SIZE];
    curlError[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, locator);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeToSink);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, curlError);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, m_config.maxRedirects);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(m_config.timeoutMs));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(m_config.connectTimeoutMs));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_config.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CL_NET_LOGI("GET %s", locator);
    CURLcode rc = curl_easy_perform(curl);

    long httpStatus = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpStatus);
    curl_easy_cleanup(curl);

    result.httpStatus = isHttpLocator(locator) ? httpStatus : 0;
    result.bytesWritten = ctx.bytesWritten;

    if (rc != CURLE_OK) {
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            result.status = FetchStatus::TIMEOUT;
        } else if (rc == CURLE_WRITE_ERROR && ctx.writeFailed) {
            result.status = FetchStatus::IO_ERROR;
        } else {
            result.status = FetchStatus::NETWORK_ERROR;
        }
        snprintf(result.errorMsg, MAX_ERROR_MSG, "%s: %s",
                 curl_easy_strerror(rc), curlError[0] != '\0' ? curlError : locator);
        CL_NET_LOGW("Fetch failed (%s): %s", fetchStatusName(result.status), result.errorMsg);
        return result;
    }

    if (isHttpLocator(locator) && (httpStatus < 200 || httpStatus > 299)) {
        result.status = FetchStatus::HTTP_STATUS;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "HTTP %ld for %s", httpStatus, locator);
        CL_NET_LOGW("%s", result.errorMsg);
        return result;
    }

    if (fflush(sink) != 0) {
        result.status = FetchStatus::IO_ERROR;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Flushing downloaded bytes failed");
        return result;
    }

    result.success = true;
    result.status = FetchStatus::OK;
    CL_NET_LOGD("Fetched %zu bytes (HTTP %ld)", result.bytesWritten, result.httpStatus);
    return result;
}

} // namespace net
} // namespace coverlight
