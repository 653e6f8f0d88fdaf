#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

struct ProgressEvent {
    std::string target_name;
    std::uint64_t total_size;
    std::uint64_t delta_bytes;
};

// Receives byte counts from every worker. Implementations must tolerate
// calls from several threads at once; events of one target arrive in order.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    // Establishes a target's total (0 = unknown) and bytes already on disk.
    virtual void begin(const std::string& name, std::uint64_t total_size, std::uint64_t initial_bytes) = 0;
    virtual void advance(const ProgressEvent& event) = 0;
    // The local partial file was discarded; the count starts over from 0.
    virtual void restart(const std::string& name) = 0;
    // Reconciles the target to its true final size.
    virtual void finish(const std::string& name, std::uint64_t total_bytes) = 0;
    virtual void close() = 0;
};

struct ProgressTotals {
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
    std::size_t finished = 0;
    std::size_t targets = 0;
};

// Aggregate progress bar on the terminal status line.
class ConsoleProgress : public ProgressSink {
public:
    explicit ConsoleProgress(bool enabled = true);

    ProgressTotals totals();

    void begin(const std::string& name, std::uint64_t total_size, std::uint64_t initial_bytes) override;
    void advance(const ProgressEvent& event) override;
    void restart(const std::string& name) override;
    void finish(const std::string& name, std::uint64_t total_bytes) override;
    void close() override;

private:
    struct Bar {
        std::uint64_t total = 0;
        std::uint64_t done = 0;
        bool finished = false;
    };

    ProgressTotals sum() const;
    void render(bool force);

    bool enabled_;
    bool closed_ = false;
    std::map<std::string, Bar> bars_;
    std::chrono::steady_clock::time_point last_render_{};
    std::mutex mtx_;
};
