#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>

namespace objcp::infra {

// Пул с ограничением на число задач "в полёте" (в очереди + выполняются).
// enqueue блокирует, пока все слоты заняты: это и есть back-pressure.
class ThreadPool {
public:
    using Task = std::function<void()>;

    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency());
    ~ThreadPool();

    // Удалить копирование и присваивание
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // false, если stop сработал раньше, чем освободился слот
    [[nodiscard]] auto enqueue(Task task, std::stop_token stop = {}) -> bool;

    // Перестаёт принимать задачи и ждёт завершения всех принятых
    void shutdown();

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }
    [[nodiscard]] auto in_flight() const -> std::size_t;

private:
    void worker_loop_(std::stop_token st);

    std::vector<std::jthread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;        // воркеры ждут задачу
    std::condition_variable_any slot_cv_;   // enqueue/shutdown ждут слот
    std::size_t in_flight_ = 0;
    std::size_t capacity_ = 1;
    bool stop_ = false;
};

inline ThreadPool::ThreadPool(std::size_t nthreads)
{
    if (nthreads == 0) nthreads = 1;
    capacity_ = nthreads;
    workers_.reserve(nthreads);

    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    shutdown();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    cv_.notify_all();
    // jthread автоматически вызовет join
}

inline auto ThreadPool::enqueue(Task task, std::stop_token stop) -> bool {
    {
        std::unique_lock lock(queue_mutex_);
        const bool ready = slot_cv_.wait(lock, stop, [this] {
            return stop_ || in_flight_ < capacity_;
        });
        if (!ready) {
            return false; // отменено
        }
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        ++in_flight_;
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

inline void ThreadPool::shutdown() {
    std::unique_lock lock(queue_mutex_);
    stop_ = true;
    slot_cv_.notify_all();
    slot_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

inline auto ThreadPool::in_flight() const -> std::size_t {
    std::lock_guard lock(queue_mutex_);
    return in_flight_;
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            if (!cv_.wait(lock, st, [this] { return !tasks_.empty(); })) {
                return; // пул разрушается
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();

        {
            std::lock_guard lock(queue_mutex_);
            --in_flight_;
        }
        slot_cv_.notify_all();
    }
}

} // namespace objcp::infra
