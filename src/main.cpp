#include "app_constants.hpp"
#include "async_probe_pool.hpp"
#include "config/config_loader.hpp"
#include "config/config_types.hpp"
#include "probe/capacity_probe.hpp"
#include "probe/posix_filesystem_stats.hpp"
#include "space/destination_aggregator.hpp"
#include "space/report_json.hpp"
#include "util/byte_format.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

void PrintReport(const SpaceCheck::Space::AggregateReport &report)
{
    for (const auto &verdict : report.verdicts) {
        std::cout << SpaceCheck::Space::FormatVerdictLine(verdict) << '\n';
    }
    if (!report.decision.warnings.empty()) {
        std::cout << "\nWarnings:\n";
        for (const auto &warning : report.decision.warnings) {
            std::cout << "  " << warning << '\n';
        }
    }
    if (!report.decision.errors.empty()) {
        std::cout << "\nErrors:\n";
        for (const auto &error : report.decision.errors) {
            std::cout << "  " << error << '\n';
        }
    }
    std::cout << '\n' << (report.decision.can_proceed ? "Backup can proceed." : "Backup blocked.")
              << std::endl;
}

}  // namespace

int main(int argc, char *argv[])
{
    // Command Line argument parsing
    CLI::App app{
        std::string(SpaceCheck::Constants::APP_NAME) +
        ": check backup destinations for enough free space"
    };

    std::string config_path_str;
    std::vector<std::string> destination_strs;
    std::string required_str;
    std::string buffer_str;
    std::optional<double> threshold_percent;
    std::optional<std::size_t> probe_threads;
    std::string log_level_str;
    bool concurrent = false;
    bool json_output = false;

    app.add_option("-c,--config", config_path_str, "Path to the configuration JSON file")
        ->check(CLI::ExistingFile);
    app.add_option("destinations", destination_strs, "Backup destination paths");
    app.add_option("-r,--required", required_str, "Estimated backup size, e.g. 10GB or 1048576");
    app.add_option("-b,--buffer", buffer_str, "Safety buffer added to the required size");
    app.add_option("--threshold", threshold_percent, "Low free-space warning threshold in percent")
        ->check(CLI::Range(0.0, 100.0));
    app.add_flag("-j,--concurrent", concurrent, "Probe destinations concurrently");
    app.add_option("--threads", probe_threads, "Worker threads for concurrent probing")
        ->check(CLI::Range(static_cast<std::size_t>(1), SpaceCheck::Constants::MAX_PROBE_THREADS));
    app.add_flag("--json", json_output, "Print the report as JSON");
    app.add_option("-l,--log-level", log_level_str, "trace, debug, info, warn, error, off");

    app.set_version_flag("-v,--version", std::string(SpaceCheck::Constants::APP_VERSION_STRING));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    // Initialize default logger (stderr, stdout carries the report) before config is parsed
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern(std::string(SpaceCheck::Constants::DEFAULT_CONSOLE_LOG_PATTERN));
        auto main_logger = std::make_shared<spdlog::logger>(
            std::string(SpaceCheck::Constants::APP_NAME), console_sink
        );
        spdlog::set_default_logger(main_logger);
        spdlog::set_level(SpaceCheck::Constants::DEFAULT_LOG_LEVEL);
        spdlog::flush_on(SpaceCheck::Constants::DEFAULT_FLUSH_LEVEL);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::optional<spdlog::level::level_enum> cli_level;
    if (!log_level_str.empty()) {
        cli_level = SpaceCheck::Config::StringToLogLevel(log_level_str);
        if (!cli_level) {
            spdlog::critical("Invalid log level: {}", log_level_str);
            return EXIT_FAILURE;
        }
        spdlog::set_level(*cli_level);
    }
    spdlog::debug("{} starting...", SpaceCheck::Constants::APP_NAME);

    // Load Configuration
    SpaceCheck::Config::CheckConfig config;
    if (!config_path_str.empty()) {
        auto config_result =
            SpaceCheck::Config::loadConfigFromFileVerbose(std::filesystem::path(config_path_str));
        if (!config_result) {
            spdlog::critical("Error loading configuration: {}", config_result.error());
            return EXIT_FAILURE;
        }
        config = std::move(config_result.value());
        if (!cli_level) {
            spdlog::set_level(config.global_settings.log_level);
        }
    }

    // Command line overrides
    if (!destination_strs.empty()) {
        config.destinations.assign(destination_strs.begin(), destination_strs.end());
    }
    if (!required_str.empty()) {
        auto required = SpaceCheck::Util::ParseSizeStringToBytes(required_str);
        if (!required) {
            spdlog::critical("Invalid required size: {}", required_str);
            return EXIT_FAILURE;
        }
        config.required_bytes = *required;
    }
    if (!buffer_str.empty()) {
        auto buffer = SpaceCheck::Util::ParseSizeStringToBytes(buffer_str);
        if (!buffer) {
            spdlog::critical("Invalid safety buffer: {}", buffer_str);
            return EXIT_FAILURE;
        }
        config.check_settings.safety_buffer_bytes = *buffer;
    }
    if (threshold_percent) {
        config.check_settings.low_free_threshold_percent = *threshold_percent;
    }
    if (concurrent) {
        config.check_settings.probe_concurrently = true;
    }
    if (probe_threads) {
        config.check_settings.probe_threads = *probe_threads;
    }

    if (config.destinations.empty() || !config.required_bytes.has_value()) {
        spdlog::critical("At least one destination and a required size (-r) are needed");
        std::cerr << app.help() << std::endl;
        return EXIT_FAILURE;
    }
    if (!config.IsValid()) {
        spdlog::critical("Configuration is invalid after applying command line options");
        return EXIT_FAILURE;
    }

    // Setup Core Components
    SpaceCheck::Probe::PosixFilesystemStats filesystem_stats;
    SpaceCheck::Probe::CapacityProbe probe(filesystem_stats);

    std::unique_ptr<SpaceCheck::AsyncProbePool> pool;
    if (config.check_settings.probe_concurrently && config.destinations.size() > 1) {
        std::size_t threads = config.check_settings.probe_threads;
        if (threads == 0) {
            const std::size_t hardware = std::max(1u, std::thread::hardware_concurrency());
            threads                    = std::min(config.destinations.size(), hardware);
        }
        pool = std::make_unique<SpaceCheck::AsyncProbePool>(threads);
    }

    SpaceCheck::Space::DestinationAggregator aggregator(
        probe, config.check_settings.ToPolicy(), pool.get()
    );
    spdlog::info(
        "Checking {} destination(s) for {} (+{} buffer)", config.destinations.size(),
        SpaceCheck::Util::FormatBytes(*config.required_bytes),
        SpaceCheck::Util::FormatBytes(config.check_settings.safety_buffer_bytes)
    );
    const auto report = aggregator.EvaluateAll(config.destinations, *config.required_bytes);

    if (json_output) {
        // Paths are not guaranteed to be valid UTF-8
        std::cout << SpaceCheck::Space::ReportToJson(report).dump(
                         2, ' ', false, nlohmann::json::error_handler_t::replace
                     )
                  << std::endl;
    } else {
        PrintReport(report);
    }

    return report.decision.can_proceed ? EXIT_SUCCESS : SpaceCheck::Constants::EXIT_BLOCKED;
}
