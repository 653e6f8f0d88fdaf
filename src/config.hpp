#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <filesystem>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path WORK_DIR;
extern std::filesystem::path L10N_DIR;
extern std::filesystem::path CONFIG_FILE;

// Derived paths
extern std::filesystem::path DOWNLOAD_DIR;
extern std::filesystem::path TEMP_DIR;
extern std::filesystem::path LOG_FILE;

struct Settings {
    unsigned max_workers = 5;
    unsigned max_retries = 10;
    std::chrono::seconds retry_delay{5};
    std::string connectivity_url = "https://www.google.com";
    std::vector<std::string> urls;
    // Mirror log records into LOG_FILE
    bool log_to_file = false;
};

// Functions
void set_work_dir(const std::string& work_dir);
void set_download_dir(const std::string& dir);
void set_temp_dir(const std::string& dir);
void set_l10n_dir(const std::string& dir);
void init_filesystem();

void load_settings(const std::filesystem::path& path, Settings& settings);
std::vector<std::string> read_url_list(const std::filesystem::path& path);
