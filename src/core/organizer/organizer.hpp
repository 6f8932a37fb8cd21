#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>
#include "../work_item.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"

namespace fsort::core {

struct ScanReport {
    std::uint64_t submitted = 0;   // всего обработано (отправлено в пул)
    std::uint64_t moved = 0;
    std::uint64_t skipped = 0;
    std::uint64_t failed = 0;
    bool timed_out = false;
    std::vector<Failed> failures;

    [[nodiscard]] auto completed() const -> std::uint64_t { return moved + skipped + failed; }
};

/// Сбор результатов от рабочих потоков.
class OutcomeAggregator {
public:
    explicit OutcomeAggregator(infra::ProgressMonitor& monitor) : monitor_(monitor) {}

    OutcomeAggregator(const OutcomeAggregator&) = delete;
    OutcomeAggregator& operator=(const OutcomeAggregator&) = delete;

    void submitted();
    void record(Outcome outcome);

    [[nodiscard]] auto snapshot() const -> ScanReport;

private:
    std::atomic<std::uint64_t> submitted_{0};
    std::atomic<std::uint64_t> moved_{0};
    std::atomic<std::uint64_t> skipped_{0};
    std::atomic<std::uint64_t> failed_{0};

    mutable std::mutex failures_mutex_;
    std::vector<Failed> failures_;
    infra::ProgressMonitor& monitor_;
};

// Обработка одного элемента; по умолчанию MoveExecutor::execute
using ItemHandler = std::function<Outcome(const WorkItem&)>;

/// Один проход по каталогу: проверка -> перечисление -> ожидание -> итог.
///
/// Всё состояние сканирования (пул, таблица блокировок, счётчики) создаётся
/// внутри run() и уничтожается при выходе из него.
class Organizer {
public:
    explicit Organizer(const infra::Config& config,
                       infra::ProgressMonitor& monitor);

    [[nodiscard]] auto run(const std::filesystem::path& source)
        -> std::expected<ScanReport, infra::Error>;

    void set_item_handler(ItemHandler handler) { handler_ = std::move(handler); }
    void set_drain_timeout(std::chrono::milliseconds timeout) { drain_timeout_ = timeout; }

private:
    [[nodiscard]] auto validate_source_(const std::filesystem::path& source) const
        -> infra::VoidResult;
    [[nodiscard]] auto enumerate_(const std::filesystem::path& source,
                                  infra::ThreadPool& pool,
                                  const ItemHandler& handler,
                                  OutcomeAggregator& aggregator) const
        -> std::optional<infra::Error>;
    [[nodiscard]] auto drain_(infra::ThreadPool& pool) const -> bool;

    const infra::Config& config_;
    infra::ProgressMonitor& monitor_;
    ItemHandler handler_;
    std::chrono::milliseconds drain_timeout_;
};

} // namespace fsort::core
