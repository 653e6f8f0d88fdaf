#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    std::mutex log_mutex;
    std::ofstream log_file;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;
    bool progress_line_active = false;

    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    std::string timestamp() {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);
        std::ostringstream out;
        out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return out.str();
    }

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view level, std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (progress_line_active && is_stdout_tty) {
            std::cout << "\r\033[K" << std::flush;
            progress_line_active = false;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }

        if (log_file.is_open()) {
            log_file << timestamp() << " - " << level << " - " << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal("INFO", get_string("info.log_prefix") + " ", COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal("WARNING", get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal("ERROR", get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_progress(const std::string& msg, double percentage, int bar_width) {
    draw_progress_line(format_progress_bar(msg, percentage, bar_width));
}

void set_log_file(const fs::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    if (path.empty()) {
        return;
    }
    if (path.has_parent_path()) {
        ensure_dir_exists(path.parent_path());
    }
    log_file.open(path, std::ios::app);
    if (!log_file) {
        throw RdlException(string_format("error.create_file_failed", path.string()) + ": " + strerror(errno));
    }
}

void draw_progress_line(std::string_view line) {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_tty();
    if (!is_stdout_tty) {
        return;
    }
    std::cout << "\r\033[K" << line << std::flush;
    progress_line_active = true;
}

void end_progress_line() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (progress_line_active) {
        std::cout << std::endl;
        progress_line_active = false;
    }
}

std::string format_progress_bar(std::string_view label, double percentage, int bar_width) {
    if (percentage < 0.0) percentage = 0.0;
    if (percentage > 100.0) percentage = 100.0;
    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::ostringstream out;
    out << COLOR_GREEN << "==> " << COLOR_WHITE << label << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) out << "#";
        else if (i == pos) out << ">";
        else out << "-";
    }
    out << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET;
    return out.str();
}

std::string format_bytes(std::uint64_t bytes) {
    static constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return std::format("{} {}", bytes, units[0]);
    }
    return std::format("{:.1f} {}", value, units[unit]);
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec) && ec) {
            throw RdlException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw RdlException(string_format("error.path_not_dir", path.string()));
    }
}

std::vector<std::string> read_lines_from_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw RdlException(string_format("error.open_file_failed", path.string()));
    }
    std::vector<std::string> result;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) result.push_back(line);
    }
    return result;
}
