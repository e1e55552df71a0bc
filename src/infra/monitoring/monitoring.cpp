#include "monitoring.hpp"
#include "../config/config.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace objcp::infra {

namespace {

auto human_bytes(double value) -> std::string {
    const char* unit = "B";
    if (value > 1024.0 * 1024 * 1024) { value /= 1024.0 * 1024 * 1024; unit = "GiB"; }
    else if (value > 1024.0 * 1024) { value /= 1024.0 * 1024; unit = "MiB"; }
    else if (value > 1024.0) { value /= 1024.0; unit = "KiB"; }
    return fmt::format("{:.1f} {}", value, unit);
}

} // namespace

// =============== Accounter ===============

Accounter::Accounter(std::uint64_t total_bytes)
    : total_bytes_(total_bytes)
    , start_time_(std::chrono::steady_clock::now())
{}

void Accounter::add(std::uint64_t bytes) {
    bytes_.fetch_add(bytes, std::memory_order_relaxed);
    objects_.fetch_add(1, std::memory_order_relaxed);
}

void Accounter::finish() {
    auto now = std::chrono::steady_clock::now() - start_time_;
    std::chrono::steady_clock::rep expected = 0;
    finished_at_.compare_exchange_strong(expected, now.count());
}

auto Accounter::summary() const -> ProgressSummary {
    return ProgressSummary{
        .bytes = bytes_.load(std::memory_order_relaxed),
        .objects = objects_.load(std::memory_order_relaxed),
    };
}

auto Accounter::elapsed() const -> std::chrono::steady_clock::duration {
    auto finished = finished_at_.load();
    if (finished != 0) {
        return std::chrono::steady_clock::duration(finished);
    }
    return std::chrono::steady_clock::now() - start_time_;
}

// =============== ProgressBar ===============

ProgressBar::ProgressBar(std::uint64_t total_bytes)
    : total_bytes_(total_bytes)
    , start_time_(std::chrono::steady_clock::now())
{
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested() && !finished_.load()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

ProgressBar::~ProgressBar() {
    finish();
}

void ProgressBar::add(std::uint64_t bytes) {
    bytes_.fetch_add(bytes, std::memory_order_relaxed);
    objects_.fetch_add(1, std::memory_order_relaxed);
}

void ProgressBar::finish() {
    if (finished_.exchange(true)) {
        return;
    }
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_.reset(); // join
    }
    render_();
    std::fputs("\n", stdout);
    std::fflush(stdout);
}

auto ProgressBar::summary() const -> ProgressSummary {
    return ProgressSummary{
        .bytes = bytes_.load(std::memory_order_relaxed),
        .objects = objects_.load(std::memory_order_relaxed),
    };
}

void ProgressBar::render_() const {
    const auto done = bytes_.load(std::memory_order_relaxed);
    const double fraction = total_bytes_ == 0
        ? 1.0
        : std::min(1.0, static_cast<double>(done) / static_cast<double>(total_bytes_));
    const int bar_width = 30;
    const int filled = static_cast<int>(fraction * bar_width);

    // Скорость (байт/сек)
    auto elapsed_sec = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time_).count();
    double bytes_per_sec = elapsed_sec > 0 ? done / elapsed_sec : 0.0;

    // ETA
    std::string eta_str = "--:--";
    if (bytes_per_sec > 0 && done < total_bytes_) {
        double eta_sec = (total_bytes_ - done) / bytes_per_sec;
        if (std::isfinite(eta_sec)) {
            int seconds = static_cast<int>(eta_sec);
            int hours = seconds / 3600;
            int minutes = (seconds % 3600) / 60;
            seconds = seconds % 60;
            eta_str = hours > 0
                ? fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds)
                : fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    // ANSI: очистить строку
    fmt::print("\r\033[K[{}] {:5.1f}% {} / {} | {}/s | ETA: {}",
               bar, fraction * 100.0,
               human_bytes(static_cast<double>(done)),
               human_bytes(static_cast<double>(total_bytes_)),
               human_bytes(bytes_per_sec),
               eta_str);
    std::fflush(stdout);
}

auto make_progress(const Config& config, std::uint64_t total_bytes)
    -> std::unique_ptr<Progress>
{
    if (config.quiet || config.json || !config.progress) {
        return std::make_unique<Accounter>(total_bytes);
    }
    return std::make_unique<ProgressBar>(total_bytes);
}

} // namespace objcp::infra
