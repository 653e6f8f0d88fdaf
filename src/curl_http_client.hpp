#pragma once

#include "http_client.hpp"

#include <curl/curl.h>

#include <cstddef>

enum class CurlErrorKind {
    CONNECTIVITY_LOST,
    CONNECT_FAILED,
    REQUEST_FAILED
};

CurlErrorKind classify_curl_error(CURLcode code);

// Whether a probe request that ended with `code` shows the network is up.
// `connected` tells if the connection was established before it ended.
bool probe_reached_network(CURLcode code, bool connected);

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

// libcurl-backed client. Every call uses its own easy handle, so one
// instance can be shared by all workers.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::size_t buffer_size = 8192);

    std::optional<std::uint64_t> head(const std::string& url, std::chrono::seconds timeout) override;
    long get(const std::string& url, std::optional<std::uint64_t> range_start,
             std::chrono::seconds timeout, ResponseHandler& handler) override;
    bool ping(const std::string& url, std::chrono::seconds timeout) override;

private:
    std::size_t buffer_size_;
};
