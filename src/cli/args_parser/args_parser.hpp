#pragma once

#include <string>
#include <cstdint>
#include <expected>
#include <optional>



namespace fsort::args_parser {
    struct CLIArgs
{
    std::string source;                         // позиционный 1, по умолчанию ~/Downloads
    std::string config;                         // позиционный 2, по умолчанию config.yaml
    std::optional<std::uint32_t> threads;       // -t, --threads=N
    std::optional<std::uint32_t> timeout_seconds; // --timeout=SECONDS
    bool verify{false};                         // --verify
    bool progress{false};                       // --progress
    bool quiet{false};                          // -q, --quiet
    bool verbose{false};                        // -v, --verbose
};

/// Каталог по умолчанию: $HOME/Downloads, без HOME просто Downloads.
std::string default_source_directory();

/// Разбор аргументов командной строки.
/// После --help или ошибки разбора (сообщение уже выведено) возвращает код выхода.
std::expected<CLIArgs, int> parse_args(int argc, char const* const* argv);

} // namespace fsort::args_parser

using __CLI = fsort::args_parser::CLIArgs;
