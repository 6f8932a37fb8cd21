#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace fsort::infra {

class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_files = 0;
        std::uint64_t moved_files = 0;
        std::uint64_t skipped_files = 0;
        std::uint64_t failed_files = 0;
        std::chrono::steady_clock::time_point start_time{};

        [[nodiscard]] auto finished_files() const -> std::uint64_t {
            return moved_files + skipped_files + failed_files;
        }
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    // Общее число растёт по ходу перечисления каталога
    void add_total(std::uint64_t files = 1);
    void file_moved();
    void file_skipped();
    void file_failed();

    [[nodiscard]] auto get_stats() const -> Stats;

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    // Атомики для thread-safe обновления
    std::atomic<std::uint64_t> total_files_{0};
    std::atomic<std::uint64_t> moved_files_{0};
    std::atomic<std::uint64_t> skipped_files_{0};
    std::atomic<std::uint64_t> failed_files_{0};

    const bool enabled_;
    const bool quiet_;
    std::chrono::steady_clock::time_point start_time_;
    mutable std::atomic<bool> shutdown_{false};
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace fsort::infra
