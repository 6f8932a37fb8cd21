#include <fmt/core.h>
#include <fmt/ranges.h>
#include <cstdlib>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/organizer/organizer.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

using ARGS = fsort::args_parser::CLIArgs;

constexpr auto load_from_cli = fsort::infra::config_from_cli;
constexpr auto load_config_file = fsort::infra::load_config_from_file;
constexpr auto args_parser = fsort::args_parser::parse_args;

static auto
__out_args_verse(const ARGS& args, const fsort::infra::Config& config)
-> void {
    spdlog::debug("Source: {}", args.source);
    spdlog::debug("Config: {}", args.config);
    spdlog::debug("Threads: {}", config.worker_count());
    spdlog::debug("Timeout: {} s", config.drain_timeout().count());
    spdlog::debug("Verify: {}", config.verify ? "yes" : "no");
    spdlog::debug("Default category: {}", config.categories.default_category());
    spdlog::debug("Categories: {}", fmt::join(config.categories.categories(), ", "));
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        fsort::infra::install_signal_handler();

        auto args_res = args_parser(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help или ошибка разбора
        }
        const auto& args = *args_res;

        if (args.verbose) spdlog::set_level(spdlog::level::debug);
        if (args.quiet) spdlog::set_level(spdlog::level::warn);

        spdlog::info("=== fsort: desktop file organizer ===");

        // 1. Загрузить из файла
        auto config_res = load_config_file(args.config);
        if (!config_res) {
            (void)fsort::infra::log_and_return(std::move(config_res.error()));
            return EXIT_FAILURE;
        }
        auto config = std::move(config_res.value());

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args)); // CLI имеет приоритет

        spdlog::info("Configuration loaded successfully.");
        spdlog::info("Configured extensions: {}", config.categories.size());
        __out_args_verse(args, config);

        fsort::infra::ProgressMonitor monitor(config.progress, config.quiet);
        fsort::core::Organizer organizer(config, monitor);

        auto start_time = std::chrono::steady_clock::now();
        auto result = organizer.run(args.source);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (!result) {
            auto err = fsort::infra::log_and_return(std::move(result.error()));
            return err.to_exit_code();
        }

        const auto& report = *result;
        spdlog::info("=== Organization Complete ===");
        spdlog::info("Total files processed: {}", report.submitted);
        spdlog::info("Moved: {}", report.moved);
        spdlog::info("Skipped: {}", report.skipped);
        spdlog::info("Failed: {}", report.failed);
        spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);

        for (const auto& failure : report.failures) {
            spdlog::warn("  {} [{}]", failure.source.string(), fsort::infra::to_string(failure.kind()));
        }

        return report.failed > 0 ? EXIT_FAILURE : EXIT_SUCCESS;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }
}
