#include "config.hpp"
#include "curl_http_client.hpp"
#include "download_orchestrator.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "progress.hpp"
#include "utils.hpp"
#include "cxxopts.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_BATCH_INCOMPLETE = 2;

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.usage_notes") << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("i,input", get_string("help.input"), cxxopts::value<std::string>())
            ("c,config", get_string("help.config"), cxxopts::value<std::string>())
            ("j,jobs", get_string("help.jobs"), cxxopts::value<unsigned>())
            ("retries", get_string("help.retries"), cxxopts::value<unsigned>())
            ("retry-delay", get_string("help.retry_delay"), cxxopts::value<unsigned>())
            ("work-dir", get_string("help.work_dir"), cxxopts::value<std::string>())
            ("download-dir", get_string("help.download_dir"), cxxopts::value<std::string>())
            ("temp-dir", get_string("help.temp_dir"), cxxopts::value<std::string>())
            ("log-file", get_string("help.log_file"), cxxopts::value<std::string>()->implicit_value(""))
            ("connectivity-url", get_string("help.connectivity_url"), cxxopts::value<std::string>())
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("urls", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"urls"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result.count("work-dir")) {
            set_work_dir(result["work-dir"].as<std::string>());
        }

        Settings settings;
        if (result.count("config")) {
            load_settings(result["config"].as<std::string>(), settings);
        } else if (fs::exists(CONFIG_FILE)) {
            load_settings(CONFIG_FILE, settings);
        }

        if (result.count("download-dir")) {
            set_download_dir(result["download-dir"].as<std::string>());
        }
        if (result.count("temp-dir")) {
            set_temp_dir(result["temp-dir"].as<std::string>());
        }
        if (result.count("jobs")) {
            settings.max_workers = result["jobs"].as<unsigned>();
        }
        if (result.count("retries")) {
            settings.max_retries = result["retries"].as<unsigned>();
        }
        if (result.count("retry-delay")) {
            settings.retry_delay = std::chrono::seconds(result["retry-delay"].as<unsigned>());
        }
        if (result.count("connectivity-url")) {
            settings.connectivity_url = result["connectivity-url"].as<std::string>();
        }
        if (result.count("log-file")) {
            const std::string log_path = result["log-file"].as<std::string>();
            if (!log_path.empty()) LOG_FILE = log_path;
            settings.log_to_file = true;
        }
        if (settings.log_to_file) {
            set_log_file(LOG_FILE);
        }

        std::vector<std::string> urls;
        if (result.count("urls")) {
            urls = result["urls"].as<std::vector<std::string>>();
        }
        if (result.count("input")) {
            const auto listed = read_url_list(result["input"].as<std::string>());
            urls.insert(urls.end(), listed.begin(), listed.end());
        }
        urls.insert(urls.end(), settings.urls.begin(), settings.urls.end());

        if (urls.empty()) {
            print_usage(options);
            throw RdlException(get_string("error.no_urls"));
        }
        if (settings.max_workers == 0) {
            throw RdlException(string_format("error.invalid_config_value", "jobs", "0"));
        }

        const std::vector<Target> targets = make_targets(urls);
        init_filesystem();

        TransferPolicy policy;
        policy.max_retries = settings.max_retries;
        policy.retry_delay = settings.retry_delay;
        policy.connectivity_poll = settings.retry_delay;

        CurlHttpClient http(policy.chunk_size);
        SizeProber prober(http);
        LocalStore store(TEMP_DIR, DOWNLOAD_DIR);
        ConnectivityMonitor monitor(http, settings.connectivity_url);
        ConsoleProgress progress(!result["quiet"].as<bool>());

        DownloadOrchestrator orchestrator({http, prober, store, monitor, progress}, policy);
        const BatchReport report = orchestrator.run(targets, settings.max_workers);

        for (const auto& outcome : report.outcomes) {
            if (outcome.phase == Phase::FAILED) {
                log_error(string_format("error.target_failed", outcome.target.display_name, outcome.error));
            }
        }
        if (!report.all_completed()) {
            return EXIT_BATCH_INCOMPLETE;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const RdlException& e) {
        log_error(string_format("error.rdl_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
