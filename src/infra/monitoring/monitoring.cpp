#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <iostream>
#include <string>
#include <thread>

namespace fsort::infra {

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , quiet_(quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    if (render_thread_) {
        stop_rendering_thread_();
    }
    if (enabled_) {
        render_();
        std::cout << "\n"; // финальный перенос
    }
}

void ProgressMonitor::add_total(std::uint64_t files) {
    total_files_.fetch_add(files, std::memory_order_relaxed);
}

void ProgressMonitor::file_moved() {
    moved_files_.fetch_add(1, std::memory_order_relaxed);
}

void ProgressMonitor::file_skipped() {
    skipped_files_.fetch_add(1, std::memory_order_relaxed);
}

void ProgressMonitor::file_failed() {
    failed_files_.fetch_add(1, std::memory_order_relaxed);
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_files = total_files_.load(),
        .moved_files = moved_files_.load(),
        .skipped_files = skipped_files_.load(),
        .failed_files = failed_files_.load(),
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested() && !shutdown_.load()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    shutdown_.store(true);
    render_thread_->request_stop();
    render_thread_.reset(); // join
}

void ProgressMonitor::render_() const {
    if (quiet_ || !enabled_) return;

    auto stats = get_stats();
    if (stats.total_files == 0) return;

    const double progress = static_cast<double>(stats.finished_files()) / stats.total_files;
    const int bar_width = 20;
    const int filled = std::min(bar_width, static_cast<int>(progress * bar_width));

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - stats.start_time).count();
    double files_per_sec = elapsed > 0 ? stats.finished_files() / elapsed : 0.0;

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    // Очистка строки и вывод
    std::cout << "\r\033[K"; // ANSI: очистить строку
    fmt::print(
        "[{}] {}/{} files | {:.1f} files/s | moved {} | failed {}",
        bar,
        stats.finished_files(),
        stats.total_files,
        files_per_sec,
        stats.moved_files,
        stats.failed_files
    );
    std::cout << std::flush;
}

} // namespace fsort::infra
