#pragma once

#include "error_handler/error.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <stop_token>
#include <thread>

namespace objcp::infra {
/*

auto res = infra::with_retry([&]() {
    return client.copy(source, target, metadata, user_metadata, stop);
}, infra::RetryPolicy{ .max_attempts = 5 }, stop);

*/
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(100);
    double backoff_factor = 2.0; // exponential backoff
};

// Повторяет только transient-ошибки. Ожидание прерывается через stop.
template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {},
                              std::stop_token stop = {})
    -> decltype(operation())
{
    const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;

    for (int attempt = 0;; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result; // успех
        }

        const auto& err = result.error();
        if (!err.is_transient() || attempt + 1 >= attempts) {
            return result; // фатальная ошибка или последняя попытка
        }

        // Экспоненциальная задержка
        auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
            policy.initial_delay * std::pow(policy.backoff_factor, attempt));
        spdlog::debug("Transient error ({}), retry {}/{} in {} ms",
                      err.message, attempt + 1, attempts - 1, delay.count());

        const auto deadline = std::chrono::steady_clock::now() + delay;
        while (std::chrono::steady_clock::now() < deadline) {
            if (stop.stop_requested()) {
                // Отмена во время ожидания: это прерывание, а не сбой
                return std::unexpected(make_error(ErrorCode::Interrupted,
                    fmt::format("Cancelled while retrying: {}", err.message)));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
}

} // namespace objcp::infra
