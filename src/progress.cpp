#include "progress.hpp"

#include "localization.hpp"
#include "utils.hpp"

namespace {
    constexpr auto RENDER_INTERVAL = std::chrono::milliseconds(100);
}

ConsoleProgress::ConsoleProgress(bool enabled) : enabled_(enabled) {}

void ConsoleProgress::begin(const std::string& name, std::uint64_t total_size, std::uint64_t initial_bytes) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& bar = bars_[name];
    bar.total = total_size;
    bar.done = initial_bytes;
    bar.finished = false;
    render(true);
}

void ConsoleProgress::advance(const ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& bar = bars_[event.target_name];
    if (event.total_size != 0) {
        bar.total = event.total_size;
    }
    bar.done += event.delta_bytes;
    render(false);
}

void ConsoleProgress::restart(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    bars_[name].done = 0;
    render(true);
}

void ConsoleProgress::finish(const std::string& name, std::uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& bar = bars_[name];
    bar.total = total_bytes;
    bar.done = total_bytes;
    bar.finished = true;
    render(true);
}

void ConsoleProgress::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
        return;
    }
    render(true);
    if (enabled_) {
        end_progress_line();
    }
    closed_ = true;
}

ProgressTotals ConsoleProgress::totals() {
    std::lock_guard<std::mutex> lock(mtx_);
    return sum();
}

ProgressTotals ConsoleProgress::sum() const {
    ProgressTotals result;
    result.targets = bars_.size();
    for (const auto& entry : bars_) {
        const Bar& bar = entry.second;
        // Unknown sizes count as whatever has arrived so far
        result.bytes_total += bar.total != 0 ? bar.total : bar.done;
        result.bytes_done += bar.done;
        if (bar.finished) ++result.finished;
    }
    return result;
}

void ConsoleProgress::render(bool force) {
    if (!enabled_ || closed_) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    if (!force && now - last_render_ < RENDER_INTERVAL) {
        return;
    }
    last_render_ = now;

    const ProgressTotals all = sum();
    const double percentage = all.bytes_total == 0
        ? 0.0
        : 100.0 * static_cast<double>(all.bytes_done) / static_cast<double>(all.bytes_total);
    log_progress(string_format("info.progress_label", all.finished, all.targets,
                               format_bytes(all.bytes_done), format_bytes(all.bytes_total)), percentage);
}
