#include "organizer.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <type_traits>
#include "../category/category_resolver.hpp"
#include "../move_executor/directory_locks.hpp"
#include "../move_executor/move_executor.hpp"
#include "../scan_filter/scan_filter.hpp"
#include "../../infra/interrupt.hpp"

namespace fsort::core {

namespace {

// Как часто ожидание проверяет флаг прерывания
constexpr std::chrono::milliseconds kPollInterval{100};

} // namespace

// =============== OutcomeAggregator ===============

void OutcomeAggregator::submitted() {
    submitted_.fetch_add(1, std::memory_order_relaxed);
    monitor_.add_total(1);
}

void OutcomeAggregator::record(Outcome outcome) {
    std::visit([this](auto&& result) {
        using T = std::decay_t<decltype(result)>;
        if constexpr (std::is_same_v<T, Moved>) {
            moved_.fetch_add(1, std::memory_order_relaxed);
            monitor_.file_moved();
        } else if constexpr (std::is_same_v<T, Skipped>) {
            spdlog::debug("Skipped {}: {}", result.source.string(), result.reason);
            skipped_.fetch_add(1, std::memory_order_relaxed);
            monitor_.file_skipped();
        } else {
            spdlog::error("Failed to organize {}: {} ({})",
                          result.source.string(), result.error.message, infra::to_string(result.kind()));
            failed_.fetch_add(1, std::memory_order_relaxed);
            monitor_.file_failed();
            std::lock_guard lock(failures_mutex_);
            failures_.push_back(std::move(result));
        }
    }, std::move(outcome));
}

auto OutcomeAggregator::snapshot() const -> ScanReport {
    ScanReport report{
        .submitted = submitted_.load(),
        .moved = moved_.load(),
        .skipped = skipped_.load(),
        .failed = failed_.load(),
    };
    std::lock_guard lock(failures_mutex_);
    report.failures = failures_;
    return report;
}

// =============== Organizer ===============

Organizer::Organizer(const infra::Config& config,
                     infra::ProgressMonitor& monitor)
    : config_(config)
    , monitor_(monitor)
    , drain_timeout_(std::chrono::duration_cast<std::chrono::milliseconds>(config.drain_timeout())) {}

auto Organizer::validate_source_(const std::filesystem::path& source) const -> infra::VoidResult {
    std::error_code ec;
    const auto status = std::filesystem::status(source, ec);
    if (!std::filesystem::exists(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidSourceDirectory,
            fmt::format("Source directory does not exist: {}", source.string())));
    }
    if (!std::filesystem::is_directory(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidSourceDirectory,
            fmt::format("Source path is not a directory: {}", source.string())));
    }
    return {};
}

auto Organizer::run(const std::filesystem::path& source)
    -> std::expected<ScanReport, infra::Error>
{
    if (auto valid = validate_source_(source); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    spdlog::info("Scanning directory: {}", source.string());
    spdlog::info("Thread pool size: {}", config_.worker_count());

    // Состояние сканирования
    CategoryResolver resolver(config_.categories);
    DirectoryLocks locks;
    MoveExecutor executor(resolver, locks, adapters::fs::MoveOptions{
        .verify = config_.verify,
        .preserve_metadata = config_.preserve_metadata,
    });
    const ItemHandler handler = handler_
        ? handler_
        : ItemHandler([&executor](const WorkItem& item) { return executor.execute(item); });
    OutcomeAggregator aggregator(monitor_);

    std::optional<infra::Error> enumeration_error;
    bool finished = false;
    {
        infra::ThreadPool pool{config_.worker_count()};

        enumeration_error = enumerate_(source, pool, handler, aggregator);
        finished = drain_(pool);
        if (!finished) {
            // Не начатые задачи увидят stop_token и завершатся как Skipped
            pool.request_stop();
            pool.wait();
        }
    } // здесь пул остановлен и потоки присоединены

    auto report = aggregator.snapshot();

    // Сигнал после завершения всей работы ничего не прервал
    const bool enumeration_stopped =
        enumeration_error && enumeration_error->code == infra::ErrorCode::Interrupted;
    if ((!finished || enumeration_stopped) && infra::is_interrupted()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
            fmt::format("Scan interrupted: {} of {} items finished ({} moved, {} failed, {} cancelled)",
                        report.completed(), report.submitted,
                        report.moved, report.failed, report.skipped)));
    }

    if (!finished) {
        report.timed_out = true;
        spdlog::warn("Some tasks did not complete within {} ms: {} item(s) cancelled",
                     drain_timeout_.count(), report.skipped);
    }

    if (enumeration_error) {
        enumeration_error->message += fmt::format(" ({} items submitted before the error)",
                                                  report.submitted);
        return std::unexpected(std::move(*enumeration_error));
    }

    return report;
}

auto Organizer::enumerate_(const std::filesystem::path& source,
                           infra::ThreadPool& pool,
                           const ItemHandler& handler,
                           OutcomeAggregator& aggregator) const
    -> std::optional<infra::Error>
{
    std::error_code ec;
    std::filesystem::directory_iterator it(source, ec);
    const std::filesystem::directory_iterator end;

    while (!ec && it != end) {
        if (infra::is_interrupted()) {
            spdlog::warn("Interrupted, stopping enumeration");
            return infra::make_error(infra::ErrorCode::Interrupted,
                fmt::format("Enumeration of {} stopped by interrupt", source.string()));
        }

        const auto& entry = *it;
        if (auto reason = rejection_reason(entry)) {
            spdlog::debug("Ignoring {}: {}", entry.path().string(), *reason);
        } else {
            aggregator.submitted();
            pool.enqueue([&handler, &aggregator, token = pool.stop_token(),
                          item = WorkItem{entry.path(), source}]() {
                if (token.stop_requested()) {
                    aggregator.record(Skipped{item.source_path, "cancelled before start"});
                    return;
                }
                try {
                    aggregator.record(handler(item));
                } catch (const std::exception& e) {
                    aggregator.record(Failed{item.source_path,
                        infra::make_error(infra::ErrorCode::IoError, e.what())});
                }
            });
        }

        it.increment(ec);
    }

    if (ec) {
        return infra::log_and_return(infra::make_io_error(ec,
            fmt::format("Failed to list {}", source.string())));
    }
    return std::nullopt;
}

auto Organizer::drain_(infra::ThreadPool& pool) const -> bool {
    const auto deadline = std::chrono::steady_clock::now() + drain_timeout_;

    for (;;) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto slice = std::min<std::chrono::steady_clock::duration>(kPollInterval, deadline - now);
        if (pool.wait_for(slice)) {
            return true;
        }
        if (infra::is_interrupted()) {
            spdlog::warn("Interrupt received, cancelling remaining work");
            return false;
        }
    }
}

} // namespace fsort::core
