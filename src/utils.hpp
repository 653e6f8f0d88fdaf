#pragma once

#include "exception.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);

// Mirror every log record into a file (empty path disables it)
void set_log_file(const fs::path& path);

// Redraws the single status line at the bottom of a terminal stdout. Log
// records printed while it is shown clear it first. No-op off a TTY.
void draw_progress_line(std::string_view line);
void end_progress_line();

std::string format_progress_bar(std::string_view label, double percentage, int bar_width = 50);
std::string format_bytes(std::uint64_t bytes);

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::vector<std::string> read_lines_from_file(const fs::path& path);
