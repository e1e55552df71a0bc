#pragma once

#include <chrono>
#include <cstdint>
#include "../transfer_unit/transfer_unit.hpp"

namespace objcp::core {

struct RunSummary {
    std::uint64_t bytes = 0;          // включая воспроизведённые единицы
    std::uint64_t objects = 0;
    std::uint64_t replayed = 0;       // пропущены как уже выполненные
    std::uint64_t errors = 0;         // неразрешённые ошибки (сканирование + единицы)
    std::uint64_t total_bytes = 0;
    std::uint64_t total_objects = 0;
    std::chrono::milliseconds elapsed{0};
};

// Представление результатов прогона. Вызывается только из потока контроллера.
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void transferred(const TransferUnit& unit) = 0;
    // unit.error заполнен
    virtual void failed(const TransferUnit& unit) = 0;
    virtual void finished(const RunSummary& summary) = 0;
};

// Вывод через spdlog. per_unit = false, когда рисуется полоса прогресса.
class LogReporter final : public Reporter {
public:
    explicit LogReporter(bool per_unit = true);

    void transferred(const TransferUnit& unit) override;
    void failed(const TransferUnit& unit) override;
    void finished(const RunSummary& summary) override;

private:
    bool per_unit_;
};

} // namespace objcp::core
