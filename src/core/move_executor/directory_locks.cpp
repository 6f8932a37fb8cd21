#include "directory_locks.hpp"

namespace fsort::core {

auto DirectoryLocks::lock(const std::filesystem::path& directory) -> std::unique_lock<std::mutex> {
    // "Base/Images" и "Base/./Images/" должны попасть в один мьютекс
    auto key = directory.lexically_normal();
    if (!key.has_filename() && key.has_parent_path()) {
        key = key.parent_path();
    }

    std::mutex* mutex = nullptr;
    {
        std::lock_guard guard(table_mutex_);
        auto& slot = locks_[key.generic_string()];
        if (!slot) {
            slot = std::make_unique<std::mutex>();
        }
        mutex = slot.get();
    }
    return std::unique_lock(*mutex);
}

auto DirectoryLocks::size() const -> std::size_t {
    std::lock_guard guard(table_mutex_);
    return locks_.size();
}

} // namespace fsort::core
