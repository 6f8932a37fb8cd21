#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "category_map.hpp"
#include "../error_handler/error.hpp"

namespace fsort::args_parser {
    struct CLIArgs;
}

namespace fsort::infra {

inline constexpr std::uint32_t kDefaultThreads = 4;
inline constexpr std::uint32_t kDefaultTimeoutSeconds = 60;
inline constexpr std::string_view kDefaultConfigFile = "config.yaml";

struct Config {
    // Workers
    std::optional<std::uint32_t> threads;
    std::optional<std::uint32_t> timeout_seconds;

    // Behavior
    bool verify = false;             // xxHash-проверка при копировании между ФС
    bool preserve_metadata = true;   // mtime и права при копировании между ФС
    bool progress = false;
    bool quiet = false;
    bool verbose = false;

    CategoryMap categories = builtin_category_map();

    [[nodiscard]] auto worker_count() const -> std::uint32_t {
        return threads.value_or(kDefaultThreads);
    }
    [[nodiscard]] auto drain_timeout() const -> std::chrono::seconds {
        return std::chrono::seconds(timeout_seconds.value_or(kDefaultTimeoutSeconds));
    }

    // Слияние с другим Config (например, из CLI). Категории не трогаются.
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из YAML-файла.
///
/// Если файла нет, он создаётся со встроенным набором категорий
/// (неудача записи не фатальна: используется встроенный набор).
/// Если в файле нет ни одного правила, тоже используется встроенный набор.
/// Ошибка чтения, синтаксиса или недопустимое значение -> ErrorCode::ConfigLoad.
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path) -> Result<Config>;

/// Разбор уже прочитанного текста (без обращения к ФС).
[[nodiscard]] auto parse_config(const std::string& yaml_text,
                                const std::string& origin = "<string>") -> Result<Config>;

/// Записывает config.yaml со встроенным набором категорий.
[[nodiscard]] auto write_default_config(const std::filesystem::path& path) -> VoidResult;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const fsort::args_parser::CLIArgs& args) -> Config;

} // namespace fsort::infra
