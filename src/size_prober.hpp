#pragma once

#include "http_client.hpp"

#include <chrono>
#include <cstdint>
#include <string>

class SizeProber {
public:
    explicit SizeProber(HttpClient& http, std::chrono::seconds timeout = std::chrono::seconds(10));

    // Total length of the remote resource, or 0 when it cannot be determined.
    // Never throws for network problems and never retries.
    std::uint64_t probe(const std::string& url);

private:
    HttpClient& http_;
    std::chrono::seconds timeout_;
};
