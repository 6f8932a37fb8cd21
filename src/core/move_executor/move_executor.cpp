#include "move_executor.hpp"
#include "../conflict/conflict_resolver.hpp"

#include <fmt/core.h>
#include <optional>
#include <spdlog/spdlog.h>

namespace fsort::core {

MoveExecutor::MoveExecutor(const CategoryResolver& categories,
                           DirectoryLocks& locks,
                           adapters::fs::MoveOptions options)
    : categories_(categories), locks_(locks), options_(options) {}

auto MoveExecutor::execute(const WorkItem& item) const -> Outcome {
    try {
        const auto category = categories_.resolve(item.source_path.filename().string());
        const auto target_dir = item.base_directory / category;

        if (auto ready = ensure_directory_(target_dir); !ready) {
            return Failed{item.source_path, std::move(ready.error())};
        }
        return move_into_(item, target_dir);

    } catch (const std::exception& e) {
        // filesystem_error, bad_alloc: ошибка этого файла, соседние не страдают
        return Failed{item.source_path, infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Unexpected error for {}: {}", item.source_path.string(), e.what()))};
    }
}

auto MoveExecutor::ensure_directory_(const std::filesystem::path& dir) const -> infra::VoidResult {
    std::error_code ec;
    const bool created = std::filesystem::create_directories(dir, ec);
    if (ec) {
        // Каталог мог создать соседний поток
        std::error_code probe;
        if (std::filesystem::is_directory(dir, probe)) {
            return {};
        }
        return std::unexpected(infra::make_io_error(ec,
            fmt::format("Cannot create directory {}", dir.string())));
    }
    if (created) {
        spdlog::info("Created directory: {}", dir.string());
    }
    return {};
}

auto MoveExecutor::move_into_(const WorkItem& item,
                              const std::filesystem::path& target_dir) const -> Outcome
{
    const auto file_name = item.source_path.filename();

    std::optional<infra::Error> probe_error;
    auto exists = [&probe_error](const std::filesystem::path& candidate) {
        auto occupied = adapters::fs::path_occupied(candidate);
        if (!occupied) {
            // Остановить перебор: каталог не читается, дальше будет то же
            probe_error.emplace(std::move(occupied.error()));
            return false;
        }
        return *occupied;
    };

    // Выбор имени и перемещение - одна критическая секция на каталог
    auto guard = locks_.lock(target_dir);
    const auto destination = resolve_conflict(target_dir / file_name, exists);
    if (probe_error) {
        return Failed{item.source_path, std::move(*probe_error)};
    }
    auto moved = adapters::fs::move_file(item.source_path, destination, options_);
    guard.unlock();

    if (!moved) {
        return Failed{item.source_path, std::move(moved.error())};
    }

    const auto relative = target_dir.filename() / destination.filename();
    if (destination.filename() == file_name) {
        spdlog::info("Moved: {} -> {}/", file_name.string(), target_dir.filename().string());
    } else {
        spdlog::info("Moved: {} -> {} (renamed)", file_name.string(), relative.string());
    }

    Moved outcome{item.source_path, destination};
    if (!moved->source_removed) {
        outcome.cleanup_failed = true;
        spdlog::warn("Copied {} to {} but could not remove the original: {}",
                     item.source_path.string(), destination.string(), moved->cleanup_error);
    }
    return outcome;
}

} // namespace fsort::core
