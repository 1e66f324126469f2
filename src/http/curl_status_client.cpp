/**
 * @file curl_status_client.cpp
 * @brief CurlStatusClient implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/http/curl_status_client.hpp"
#include "agentwatch/utils/logger.hpp"

#include <curl/curl.h>

#include <memory>

namespace agentwatch {
namespace http {

namespace {

// curl_global_init is not thread-safe; run it once before any handle exists.
struct CurlGlobal {
    CurlGlobal() : code(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() {
        if (code == CURLE_OK) {
            curl_global_cleanup();
        }
    }
    CURLcode code;
};

bool ensureCurlInitialized() {
    static CurlGlobal global;
    if (global.code != CURLE_OK) {
        LOG_ERROR("HttpClient", "curl_global_init failed: {}", curl_easy_strerror(global.code));
        return false;
    }
    return true;
}

struct EasyHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;

size_t appendBody(char* data, size_t size, size_t count, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * count);
    return size * count;
}

}  // namespace

std::string buildStatusUrl(const HttpClientConfig& config, uint16_t port) {
    return "http://" + config.host + ":" + std::to_string(port) + config.status_path;
}

CurlStatusClient::CurlStatusClient(HttpClientConfig config)
    : config_(std::move(config))
{
    ensureCurlInitialized();
}

std::optional<std::string> CurlStatusClient::fetchStatus(const core::DiscoveredInstance& instance) {
    if (!instance.hasPort()) {
        LOG_DEBUG("HttpClient", "{} has no port, skipping", instance.identity());
        return std::nullopt;
    }
    return get(buildStatusUrl(config_, instance.port()));
}

std::optional<std::string> CurlStatusClient::get(const std::string& url) {
    if (!ensureCurlInitialized()) {
        return std::nullopt;
    }

    EasyHandle handle(curl_easy_init());
    if (!handle) {
        LOG_WARN("HttpClient", "curl_easy_init failed");
        return std::nullopt;
    }

    std::string body;
    long timeoutMs = static_cast<long>(config_.timeout.count());
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);

    CURLcode code = curl_easy_perform(handle.get());
    if (code != CURLE_OK) {
        LOG_DEBUG("HttpClient", "GET {} failed: {}", url, curl_easy_strerror(code));
        return std::nullopt;
    }

    long status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        LOG_DEBUG("HttpClient", "GET {} returned HTTP {}", url, status);
        return std::nullopt;
    }

    LOG_TRACE("HttpClient", "GET {} -> {} bytes", url, body.size());
    return body;
}

}  // namespace http
}  // namespace agentwatch
