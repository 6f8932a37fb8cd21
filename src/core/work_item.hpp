#pragma once

#include <filesystem>
#include <string>
#include <variant>
#include "../infra/error_handler/error.hpp"

namespace fsort::core {

// Одна единица работы: файл и каталог, в котором создаются категории.
// Создаётся при перечислении и больше не меняется.
struct WorkItem {
    std::filesystem::path source_path;
    std::filesystem::path base_directory;
};

struct Moved {
    std::filesystem::path from;
    std::filesystem::path to;
    bool cleanup_failed = false;   // копия между ФС есть, исходник удалить не удалось
};

struct Skipped {
    std::filesystem::path source;
    std::string reason;
};

struct Failed {
    std::filesystem::path source;
    infra::Error error;

    [[nodiscard]] auto kind() const -> infra::ErrorCode { return error.code; }
};

using Outcome = std::variant<Moved, Skipped, Failed>;

} // namespace fsort::core
