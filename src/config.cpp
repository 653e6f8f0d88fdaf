#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace fs = std::filesystem;

fs::path WORK_DIR = ".";
fs::path L10N_DIR = RDL_L10N_DIR;
fs::path CONFIG_FILE = fs::path(RDL_CONF_DIR) / "rdl.conf";

// Derived paths
fs::path DOWNLOAD_DIR = "downloads";
fs::path TEMP_DIR = "temp";
fs::path LOG_FILE = "download.log";

namespace {

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

unsigned parse_unsigned(std::string_view key, std::string_view value) {
    unsigned result = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        throw RdlException(string_format("error.invalid_config_value", std::string(key), std::string(value)));
    }
    return result;
}

} // anonymous namespace

void set_work_dir(const std::string& work_dir) {
    WORK_DIR = fs::path(work_dir).lexically_normal();
    if (WORK_DIR.empty()) WORK_DIR = ".";

    DOWNLOAD_DIR = WORK_DIR / "downloads";
    TEMP_DIR = WORK_DIR / "temp";
    LOG_FILE = WORK_DIR / "download.log";
}

void set_download_dir(const std::string& dir) {
    DOWNLOAD_DIR = fs::path(dir).lexically_normal();
}

void set_temp_dir(const std::string& dir) {
    TEMP_DIR = fs::path(dir).lexically_normal();
}

void set_l10n_dir(const std::string& dir) {
    L10N_DIR = fs::path(dir);
}

void init_filesystem() {
    ensure_dir_exists(DOWNLOAD_DIR);
    ensure_dir_exists(TEMP_DIR);
}

void load_settings(const fs::path& path, Settings& settings) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw RdlException(string_format("error.open_file_failed", path.string()));
    }

    std::string raw;
    while (std::getline(file, raw)) {
        const std::string_view line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        const auto pos = line.find('=');
        if (pos == std::string_view::npos) {
            log_warning(string_format("warning.config_line_ignored", std::string(line)));
            continue;
        }
        const std::string_view key = trim(line.substr(0, pos));
        const std::string_view value = trim(line.substr(pos + 1));

        if (key == "url") {
            if (!value.empty()) settings.urls.emplace_back(value);
        } else if (key == "max_workers") {
            settings.max_workers = parse_unsigned(key, value);
        } else if (key == "max_retries") {
            settings.max_retries = parse_unsigned(key, value);
        } else if (key == "retry_delay") {
            settings.retry_delay = std::chrono::seconds(parse_unsigned(key, value));
        } else if (key == "connectivity_url") {
            settings.connectivity_url = std::string(value);
        } else if (key == "download_dir") {
            set_download_dir(std::string(value));
        } else if (key == "temp_dir") {
            set_temp_dir(std::string(value));
        } else if (key == "log_file") {
            if (!value.empty()) LOG_FILE = fs::path(value);
            settings.log_to_file = true;
        } else {
            log_warning(string_format("warning.unknown_config_key", std::string(key)));
        }
    }

    if (settings.max_workers == 0) {
        throw RdlException(string_format("error.invalid_config_value", "max_workers", "0"));
    }
}

std::vector<std::string> read_url_list(const fs::path& path) {
    std::vector<std::string> urls;
    for (const auto& line : read_lines_from_file(path)) {
        const std::string_view url = trim(line);
        if (url.empty() || url[0] == '#') continue;
        urls.emplace_back(url);
    }
    return urls;
}
