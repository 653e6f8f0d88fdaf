#include "download_orchestrator.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>

namespace {

// Runs fn(0..count-1) on up to `workers` threads. Indices are handed out in
// order, so the earliest pending item starts as soon as a worker frees up.
template<typename Fn>
void run_bounded(std::size_t count, unsigned workers, Fn fn) {
    std::atomic<std::size_t> next{0};
    const std::size_t pool_size = std::min<std::size_t>(workers, count);

    std::vector<std::future<void>> pool;
    pool.reserve(pool_size);
    for (std::size_t w = 0; w < pool_size; ++w) {
        pool.push_back(std::async(std::launch::async, [&] {
            for (std::size_t i = next++; i < count; i = next++) {
                fn(i);
            }
        }));
    }
    for (auto& worker : pool) {
        worker.get();
    }
}

} // anonymous namespace

std::size_t BatchReport::completed_count() const {
    return static_cast<std::size_t>(std::ranges::count(outcomes, Phase::COMPLETED, &TransferOutcome::phase));
}

std::size_t BatchReport::failed_count() const {
    return outcomes.size() - completed_count();
}

DownloadOrchestrator::DownloadOrchestrator(const TransferServices& services, const TransferPolicy& policy)
    : services_(services), policy_(policy) {}

BatchReport DownloadOrchestrator::run(const std::vector<Target>& targets, unsigned max_workers) {
    if (max_workers == 0) {
        throw RdlException(string_format("error.invalid_config_value", "max_workers", "0"));
    }
    services_.store.prepare();
    log_info(string_format("info.batch_start", targets.size(), max_workers));

    // Totals first, so the progress display knows the whole batch up front
    std::vector<std::uint64_t> sizes(targets.size(), 0);
    run_bounded(targets.size(), max_workers, [&](std::size_t i) {
        sizes[i] = services_.prober.probe(targets[i].url);
    });
    for (std::size_t i = 0; i < targets.size(); ++i) {
        const std::string& name = targets[i].display_name;
        std::uint64_t initial = services_.store.existing_bytes(name, Location::TEMP);
        if (sizes[i] != 0) initial = std::min(initial, sizes[i]);
        services_.progress.begin(name, sizes[i], initial);
    }

    BatchReport report;
    report.outcomes.resize(targets.size());
    run_bounded(targets.size(), max_workers, [&](std::size_t i) {
        report.outcomes[i] = run_one(targets[i]);
    });

    services_.progress.close();
    log_info(string_format("info.batch_summary", report.completed_count(), report.failed_count(), targets.size()));
    return report;
}

TransferOutcome DownloadOrchestrator::run_one(const Target& target) {
    TransferOutcome outcome;
    outcome.target = target;
    try {
        ResumableTransfer transfer(target, services_, policy_);
        outcome.phase = transfer.run();
        outcome.bytes = transfer.state().bytes_completed;
        outcome.retries = transfer.state().retry_count;
        if (outcome.phase == Phase::FAILED) {
            outcome.error = transfer.last_error();
        }
    } catch (const std::exception& e) {
        log_error(string_format("error.worker_fault", target.display_name, e.what()));
        outcome.phase = Phase::FAILED;
        outcome.error = e.what();
    } catch (...) {
        log_error(string_format("error.worker_fault", target.display_name, "unknown exception"));
        outcome.phase = Phase::FAILED;
        outcome.error = "unknown exception";
    }
    return outcome;
}
