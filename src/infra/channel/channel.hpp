#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace objcp::infra {

// Очередь сообщений между потоками. После close() push игнорируется,
// pop() дочитывает остаток и возвращает nullopt.
template<typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // false, если канал уже закрыт
    auto push(T value) -> bool {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    // Блокирует, пока не появится элемент или канал не закроется
    [[nodiscard]] auto pop() -> std::optional<T> {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) return std::nullopt;
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto closed() const -> bool {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace objcp::infra
