#pragma once

#include <atomic>
#include <csignal>

namespace fsort::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Сброс флага (для повторных запусков в одном процессе, в основном в тестах)
inline void clear_interrupted() {
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace fsort::infra
