#include "size_prober.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

SizeProber::SizeProber(HttpClient& http, std::chrono::seconds timeout)
    : http_(http), timeout_(timeout) {}

std::uint64_t SizeProber::probe(const std::string& url) {
    try {
        if (auto length = http_.head(url, timeout_)) {
            return *length;
        }
        log_warning(string_format("warning.size_unknown", url));
    } catch (const NetworkError& e) {
        log_warning(string_format("warning.size_probe_failed", url, e.what()));
    }
    return 0;
}
