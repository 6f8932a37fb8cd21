#include "interrupt.hpp"

namespace fsort::infra {

std::atomic<bool> g_interrupted{false};

namespace {

// В обработчике сигнала допустима только запись в lock-free атомик,
// сообщение пишет диспетчер, когда увидит флаг.
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace fsort::infra
