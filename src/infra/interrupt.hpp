#pragma once

#include <atomic>
#include <csignal>
#include <stop_token>
#include <thread>

namespace objcp::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Переводит флаг сигнала в общий std::stop_source отмены.
// Сам обработчик сигнала только выставляет флаг.
class InterruptWatcher {
public:
    InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    [[nodiscard]] auto token() const -> std::stop_token { return source_.get_token(); }

private:
    std::stop_source source_;
    std::jthread watcher_;
};

} // namespace objcp::infra
