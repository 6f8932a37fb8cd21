#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <cstdlib>
#include <filesystem>

#include "../../infra/config/config.hpp"

namespace fsort::args_parser {

std::string default_source_directory() {
    const char* home = std::getenv("HOME");
#ifdef _WIN32
    if (!home) home = std::getenv("USERPROFILE");
#endif
    if (home && *home) {
        return (std::filesystem::path(home) / "Downloads").string();
    }
    return "Downloads";
}

std::expected<CLIArgs, int> parse_args(int argc, char const* const* argv) {
    CLIArgs args;
    args.source = default_source_directory();
    args.config = std::string(infra::kDefaultConfigFile);

    CLI::App app{"fsort - sorts files of a directory into category folders by extension"};

    app.add_option("source", args.source, "Directory to organize")
        ->capture_default_str();
    app.add_option("config", args.config, "YAML file with extension -> category rules")
        ->capture_default_str();

    app.add_option("-t,--threads", args.threads, "Number of worker threads")
        ->check(CLI::Range(1u, 1024u));
    app.add_option("--timeout", args.timeout_seconds, "Seconds to wait for workers after the scan")
        ->check(CLI::PositiveNumber);
    app.add_flag("--verify", args.verify, "Verify cross-filesystem copies with xxHash64");
    app.add_flag("--progress", args.progress, "Show a progress bar");

    auto* quiet = app.add_flag("-q,--quiet", args.quiet, "Only report warnings and errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug output")->excludes(quiet);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }
    return args;
}

} // namespace fsort::args_parser
