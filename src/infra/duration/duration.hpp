#pragma once

#include <chrono>
#include <optional>
#include <string_view>
#include "../error_handler/error.hpp"

namespace objcp::infra {

/// Разбирает возраст объекта вида "7d10h", "1w", "90m", "45s".
/// Единицы: w, d, h, m, s. Каждое число обязано иметь единицу.
[[nodiscard]] auto parse_duration(std::string_view text)
    -> Result<std::chrono::seconds>;

// Фильтр по возрасту объекта (--older-than / --newer-than)
class AgeFilter {
public:
    AgeFilter() = default;

    /// Пустые строки означают "без ограничения".
    [[nodiscard]] static auto create(std::string_view older_than,
                                     std::string_view newer_than)
        -> Result<AgeFilter>;

    // true, если объект с таким mod_time нужно пропустить
    [[nodiscard]] auto skip(std::chrono::system_clock::time_point mod_time,
                            std::chrono::system_clock::time_point now =
                                std::chrono::system_clock::now()) const -> bool;

    [[nodiscard]] auto active() const -> bool {
        return older_than_.has_value() || newer_than_.has_value();
    }

private:
    std::optional<std::chrono::seconds> older_than_;
    std::optional<std::chrono::seconds> newer_than_;
};

} // namespace objcp::infra
