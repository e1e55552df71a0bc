#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace objcp::infra {

struct Config;

struct ProgressSummary {
    std::uint64_t bytes = 0;
    std::uint64_t objects = 0;
};

// Приёмник прогресса. Обновляется конкурентно из воркеров.
class Progress {
public:
    virtual ~Progress() = default;

    // Учитывает один объект размером bytes
    virtual void add(std::uint64_t bytes) = 0;
    virtual void finish() = 0;
    [[nodiscard]] virtual auto summary() const -> ProgressSummary = 0;
};

// Тихий учёт: только счётчики (режимы --quiet и --json)
class Accounter final : public Progress {
public:
    explicit Accounter(std::uint64_t total_bytes = 0);

    void add(std::uint64_t bytes) override;
    void finish() override;
    [[nodiscard]] auto summary() const -> ProgressSummary override;

    [[nodiscard]] auto total_bytes() const -> std::uint64_t { return total_bytes_; }
    [[nodiscard]] auto elapsed() const -> std::chrono::steady_clock::duration;

private:
    std::atomic<std::uint64_t> bytes_{0};
    std::atomic<std::uint64_t> objects_{0};
    const std::uint64_t total_bytes_;
    const std::chrono::steady_clock::time_point start_time_;
    std::atomic<std::chrono::steady_clock::rep> finished_at_{0};
};

// Интерактивная полоса прогресса, перерисовывается фоновым потоком
class ProgressBar final : public Progress {
public:
    explicit ProgressBar(std::uint64_t total_bytes);
    ~ProgressBar() override;

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    void add(std::uint64_t bytes) override;
    void finish() override;
    [[nodiscard]] auto summary() const -> ProgressSummary override;

private:
    void render_() const;

    std::atomic<std::uint64_t> bytes_{0};
    std::atomic<std::uint64_t> objects_{0};
    const std::uint64_t total_bytes_;
    const std::chrono::steady_clock::time_point start_time_;
    std::atomic<bool> finished_{false};
    std::unique_ptr<std::jthread> render_thread_;
};

/// Интерактивный режим, если не включены quiet/json и progress не выключен.
[[nodiscard]] auto make_progress(const Config& config, std::uint64_t total_bytes)
    -> std::unique_ptr<Progress>;

} // namespace objcp::infra
