#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "../../adapters/storage/storage_client.hpp"
#include "../../infra/error_handler/error.hpp"

namespace objcp::core {

// Сторона пары: адрес плюс атрибуты объекта
struct Content {
    adapters::Location location;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point mod_time{};
    adapters::Metadata metadata;
    adapters::Metadata user_metadata;
};

// Единица работы: одна пара источник -> цель
struct TransferUnit {
    std::string source_alias;
    std::string target_alias;
    Content source;
    Content target;

    // Итоги всего прогона, копируются в каждую единицу для отчётов
    std::uint64_t total_count = 0;
    std::uint64_t total_size = 0;

    // Наличие ошибки означает окончательный отказ по этой единице
    std::optional<infra::Error> error;

    // Идентификатор единицы для контрольной точки
    [[nodiscard]] auto id() const -> std::string { return source.location.url(); }
};

/// Одна строка журнала работы (YAML flow-mapping без перевода строки)
[[nodiscard]] auto to_line(const TransferUnit& unit) -> std::string;

/// CorruptSession, если строка не является единицей работы
[[nodiscard]] auto from_line(std::string_view line) -> infra::Result<TransferUnit>;

} // namespace objcp::core
