#include "resumable_transfer.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <thread>
#include <utility>

namespace {
    constexpr long HTTP_PARTIAL_CONTENT = 206;
    constexpr long HTTP_RANGE_NOT_SATISFIABLE = 416;
}

std::string_view phase_name(Phase phase) {
    switch (phase) {
        case Phase::PROBING: return "probing";
        case Phase::RESUMING: return "resuming";
        case Phase::STARTING: return "starting";
        case Phase::STREAMING: return "streaming";
        case Phase::FINALIZING: return "finalizing";
        case Phase::COMPLETED: return "completed";
        case Phase::FAILED: return "failed";
    }
    return "unknown";
}

bool is_terminal(Phase phase) {
    return phase == Phase::COMPLETED || phase == Phase::FAILED;
}

// Writes the body of one GET into the temp file. The file is opened only
// once the status is known, since a server may ignore the range request.
class ResumableTransfer::StreamWriter : public ResponseHandler {
public:
    StreamWriter(ResumableTransfer& transfer, std::uint64_t start)
        : transfer_(transfer), start_(start) {}

    void on_response(long status) override {
        const std::string& name = transfer_.state_.target.display_name;
        if (start_ > 0 && status != HTTP_PARTIAL_CONTENT) {
            log_warning(string_format("warning.resume_unsupported", name, status));
            start_ = 0;
            transfer_.restart_fresh();
        }

        const LocalStore& store = transfer_.services_.store;
        file_ = start_ > 0 ? store.open_for_append(name) : store.open_for_write(name);
        transfer_.transition(Phase::STREAMING);
    }

    void on_data(const char* data, std::size_t size) override {
        const std::size_t chunk = std::max<std::size_t>(transfer_.policy_.chunk_size, 1);
        TransferState& state = transfer_.state_;
        while (size > 0) {
            const std::size_t n = std::min(chunk, size);
            file_.write(data, static_cast<std::streamsize>(n));
            if (!file_) {
                throw RdlException(string_format("error.write_failed", state.target.display_name));
            }
            state.bytes_completed += n;
            transfer_.services_.progress.advance({state.target.display_name, state.total_size, n});
            data += n;
            size -= n;
        }
    }

    void close() {
        file_.close();
        if (file_.fail()) {
            throw RdlException(string_format("error.write_failed", transfer_.state_.target.display_name));
        }
    }

private:
    ResumableTransfer& transfer_;
    std::uint64_t start_;
    std::ofstream file_;
};

ResumableTransfer::ResumableTransfer(Target target, const TransferServices& services, const TransferPolicy& policy)
    : services_(services), policy_(policy) {
    state_.target = std::move(target);
}

Phase ResumableTransfer::run() {
    const std::string& name = state_.target.display_name;

    transition(Phase::PROBING);
    state_.total_size = services_.prober.probe(state_.target.url);

    if (services_.store.is_already_complete(name, state_.total_size)) {
        log_info(string_format("info.already_downloaded", name));
        state_.bytes_completed = state_.total_size;
        services_.progress.finish(name, state_.total_size);
        transition(Phase::COMPLETED);
        return state_.phase;
    }
    if (services_.store.discard_final(name)) {
        log_warning(string_format("warning.stale_final_removed", name));
    }

    while (!is_terminal(state_.phase)) {
        try {
            const std::uint64_t start = prepare_offset();
            if (state_.phase != Phase::FINALIZING) {
                stream(start);
            }
            finalize();
        } catch (const ConnectivityLostError& e) {
            await_connectivity(e.what());
        } catch (const ConnectFailedError& e) {
            // DNS and connect failures only count against the budget when
            // the rest of the network is demonstrably up.
            if (services_.monitor.is_reachable()) {
                schedule_retry(e.what());
            } else {
                await_connectivity(e.what());
            }
        } catch (const RdlException& e) {
            schedule_retry(e.what());
        }
    }
    return state_.phase;
}

void ResumableTransfer::transition(Phase next) {
    if (state_.phase == next && next != Phase::PROBING) return;
    state_.phase = next;
    log_info(string_format("info.phase_change", state_.target.display_name, phase_name(next)));
}

std::uint64_t ResumableTransfer::prepare_offset() {
    const std::string& name = state_.target.display_name;
    std::uint64_t start = services_.store.existing_bytes(name, Location::TEMP);

    if (state_.total_size != 0 && start > state_.total_size) {
        log_warning(string_format("warning.partial_too_large", name, start, state_.total_size));
        services_.store.discard_partial(name);
        services_.progress.restart(name);
        start = 0;
    }
    state_.bytes_completed = start;

    if (state_.total_size != 0 && start == state_.total_size) {
        transition(Phase::FINALIZING);
    } else if (start > 0) {
        log_info(string_format("info.resuming_from", name, start));
        transition(Phase::RESUMING);
    } else {
        transition(Phase::STARTING);
    }
    return start;
}

void ResumableTransfer::stream(std::uint64_t start) {
    StreamWriter writer(*this, start);
    const std::optional<std::uint64_t> range = start > 0 ? std::optional<std::uint64_t>(start) : std::nullopt;
    try {
        services_.http.get(state_.target.url, range, policy_.stream_timeout, writer);
    } catch (const RequestFailedError& e) {
        if (start == 0 || e.http_status() != HTTP_RANGE_NOT_SATISFIABLE) {
            throw;
        }
        // The partial file already covers the whole resource, or the
        // resource changed underneath it. Start over without a range.
        log_warning(string_format("warning.range_not_satisfiable", state_.target.display_name, start));
        services_.store.discard_partial(state_.target.display_name);
        restart_fresh();
        stream(0);
        return;
    }
    writer.close();
}

void ResumableTransfer::finalize() {
    const std::string& name = state_.target.display_name;
    transition(Phase::FINALIZING);
    services_.store.finalize(name);

    if (state_.total_size != 0) {
        state_.bytes_completed = state_.total_size;
    }
    services_.progress.finish(name, state_.bytes_completed);
    transition(Phase::COMPLETED);
    log_info(string_format("info.download_completed", name, format_bytes(state_.bytes_completed)));
}

void ResumableTransfer::restart_fresh() {
    state_.bytes_completed = 0;
    services_.progress.restart(state_.target.display_name);
    transition(Phase::STARTING);
}

void ResumableTransfer::await_connectivity(const std::string& reason) {
    last_error_ = reason;
    log_warning(string_format("warning.connection_lost", state_.target.display_name, reason));
    // Reconnects are spaced at least one poll interval apart
    std::this_thread::sleep_for(policy_.connectivity_poll);
    services_.monitor.block_until_reachable(policy_.connectivity_poll);
}

void ResumableTransfer::schedule_retry(const std::string& reason) {
    last_error_ = reason;
    ++state_.retry_count;
    if (state_.retry_count > policy_.max_retries) {
        log_error(string_format("error.retries_exhausted", state_.target.display_name, policy_.max_retries));
        transition(Phase::FAILED);
        return;
    }
    log_error(string_format("error.download_retry", state_.target.display_name, reason, state_.retry_count, policy_.max_retries));
    std::this_thread::sleep_for(policy_.retry_delay);
}
