#include "interrupt.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace objcp::infra {

std::atomic<bool> g_interrupted{false};

namespace {

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

InterruptWatcher::InterruptWatcher()
    : watcher_([this](std::stop_token st) {
        while (!st.stop_requested()) {
            if (is_interrupted()) {
                spdlog::warn("Received interrupt signal. Shutting down gracefully...");
                source_.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    })
{}

} // namespace objcp::infra
