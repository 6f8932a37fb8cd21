#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace fsort::core {

/// Мьютекс на каждый каталог назначения.
///
/// Под ним выполняется пара "выбрать свободное имя -> переместить файл",
/// так что два потока не выберут одно имя в одном каталоге. Разные
/// каталоги друг друга не блокируют. Мьютексы создаются по запросу и
/// живут до конца сканирования (ссылки на них стабильны).
class DirectoryLocks {
public:
    DirectoryLocks() = default;
    DirectoryLocks(const DirectoryLocks&) = delete;
    DirectoryLocks& operator=(const DirectoryLocks&) = delete;

    [[nodiscard]] auto lock(const std::filesystem::path& directory) -> std::unique_lock<std::mutex>;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex table_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> locks_;
};

} // namespace fsort::core
