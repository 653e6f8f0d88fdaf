#include "connectivity_monitor.hpp"

#include "localization.hpp"
#include "utils.hpp"

#include <thread>
#include <utility>

ConnectivityMonitor::ConnectivityMonitor(HttpClient& http, std::string probe_url, std::chrono::seconds timeout)
    : http_(http), probe_url_(std::move(probe_url)), timeout_(timeout) {}

bool ConnectivityMonitor::is_reachable() {
    return http_.ping(probe_url_, timeout_);
}

void ConnectivityMonitor::block_until_reachable(std::chrono::milliseconds poll_interval) {
    if (is_reachable()) {
        return;
    }
    do {
        log_warning(string_format("warning.no_connectivity", poll_interval.count()));
        std::this_thread::sleep_for(poll_interval);
    } while (!is_reachable());
    log_info(get_string("info.connectivity_restored"));
}
