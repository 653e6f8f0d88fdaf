#pragma once

#include "http_client.hpp"

#include <chrono>
#include <string>

class ConnectivityMonitor {
public:
    ConnectivityMonitor(HttpClient& http, std::string probe_url,
                        std::chrono::seconds timeout = std::chrono::seconds(5));

    bool is_reachable();

    // Polls until the probe endpoint answers. There is no upper bound.
    void block_until_reachable(std::chrono::milliseconds poll_interval);

private:
    HttpClient& http_;
    std::string probe_url_;
    std::chrono::seconds timeout_;
};
