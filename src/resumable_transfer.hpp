#pragma once

#include "connectivity_monitor.hpp"
#include "http_client.hpp"
#include "local_store.hpp"
#include "progress.hpp"
#include "size_prober.hpp"
#include "target.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

enum class Phase {
    PROBING,
    RESUMING,
    STARTING,
    STREAMING,
    FINALIZING,
    COMPLETED,
    FAILED
};

std::string_view phase_name(Phase phase);
bool is_terminal(Phase phase);

struct TransferState {
    Target target;
    std::uint64_t total_size = 0; // 0 = unknown
    std::uint64_t bytes_completed = 0;
    Phase phase = Phase::PROBING;
    std::uint32_t retry_count = 0;
};

struct TransferPolicy {
    std::uint32_t max_retries = 10;
    std::chrono::milliseconds retry_delay{5000};
    std::chrono::milliseconds connectivity_poll{5000};
    std::chrono::seconds stream_timeout{30};
    std::size_t chunk_size = 8192;
};

// Collaborators shared by every transfer of a batch. All of them are safe
// to use from several workers at once.
struct TransferServices {
    HttpClient& http;
    SizeProber& prober;
    const LocalStore& store;
    ConnectivityMonitor& monitor;
    ProgressSink& progress;
};

class ResumableTransfer {
public:
    ResumableTransfer(Target target, const TransferServices& services, const TransferPolicy& policy);

    // Drives the target to COMPLETED or FAILED. Network and storage errors
    // are handled here and never escape.
    Phase run();

    const TransferState& state() const { return state_; }
    const std::string& last_error() const { return last_error_; }

private:
    class StreamWriter;

    void transition(Phase next);
    std::uint64_t prepare_offset();
    void stream(std::uint64_t start);
    void finalize();
    void restart_fresh();

    void await_connectivity(const std::string& reason);
    void schedule_retry(const std::string& reason);

    TransferState state_;
    TransferServices services_;
    TransferPolicy policy_;
    std::string last_error_;
};
