#pragma once

#include "resumable_transfer.hpp"
#include "target.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct TransferOutcome {
    Target target;
    Phase phase = Phase::FAILED;
    std::uint64_t bytes = 0;
    std::uint32_t retries = 0;
    std::string error;
};

struct BatchReport {
    // Same order as the targets passed to run()
    std::vector<TransferOutcome> outcomes;

    std::size_t completed_count() const;
    std::size_t failed_count() const;
    bool all_completed() const { return failed_count() == 0; }
};

class DownloadOrchestrator {
public:
    DownloadOrchestrator(const TransferServices& services, const TransferPolicy& policy);

    // Attempts every target exactly once with at most max_workers transfers
    // in flight. One target failing never stops the others.
    BatchReport run(const std::vector<Target>& targets, unsigned max_workers);

private:
    TransferOutcome run_one(const Target& target);

    TransferServices services_;
    TransferPolicy policy_;
};
