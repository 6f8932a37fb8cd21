#pragma once

#include <filesystem>
#include "../work_item.hpp"
#include "../category/category_resolver.hpp"
#include "directory_locks.hpp"
#include "../../adapters/fs.hpp"
#include "../../infra/error_handler/error.hpp"

namespace fsort::core {

/// Перемещение одного файла в каталог его категории.
///
/// Порядок: категория -> каталог категории (create_directories, гонка
/// создателей не ошибка) -> под блокировкой каталога выбор свободного
/// имени и rename без перезаписи -> Outcome. Любая ошибка ввода-вывода
/// превращается в Failed и не выходит за пределы execute().
class MoveExecutor {
public:
    MoveExecutor(const CategoryResolver& categories,
                 DirectoryLocks& locks,
                 adapters::fs::MoveOptions options = {});

    [[nodiscard]] auto execute(const WorkItem& item) const -> Outcome;

private:
    [[nodiscard]] auto ensure_directory_(const std::filesystem::path& dir) const -> infra::VoidResult;
    [[nodiscard]] auto move_into_(const WorkItem& item,
                                  const std::filesystem::path& target_dir) const -> Outcome;

    const CategoryResolver& categories_;
    DirectoryLocks& locks_;
    adapters::fs::MoveOptions options_;
};

} // namespace fsort::core
