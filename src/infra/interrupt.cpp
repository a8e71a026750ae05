#include "interrupt.hpp"

namespace rcopy::infra {

std::atomic<bool> g_interrupted{false};

// Только async-signal-safe операции: текущий файл докопируется,
// сообщение в лог пишет движок при выходе из цикла.
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace rcopy::infra
