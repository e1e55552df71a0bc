#pragma once

#include <cstdint>
#include <stop_token>
#include <string>
#include "../../adapters/storage/storage_client.hpp"
#include "../../extensions/session/session.hpp"
#include "../../infra/duration/duration.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../transfer_unit/transfer_unit.hpp"

namespace objcp::core {

struct ScanStats {
    std::uint64_t objects = 0;   // записано в журнал
    std::uint64_t bytes = 0;
    std::uint64_t skipped = 0;   // отброшено фильтром возраста
    std::uint64_t errors = 0;    // источники, которые не удалось обойти
};

// Сканирует источники из заголовка сессии и пишет журнал работы.
// Источники и цель берутся из header().command_args, флаги из header().options.
class Enumerator {
public:
    Enumerator(adapters::StorageClient& client, extensions::Session& session);

    /// Interrupted при отмене; журнал при этом неполный и не годится для resume.
    /// Ошибки ввода-вывода сессии фатальны. Ошибки отдельных источников
    /// логируются и считаются в ScanStats::errors.
    [[nodiscard]] auto run(std::stop_token stop) -> infra::Result<ScanStats>;

private:
    struct Plan {
        adapters::Location target;
        bool target_is_folder = false;
        infra::AgeFilter filter;
    };

    [[nodiscard]] auto make_plan_() -> infra::Result<Plan>;
    [[nodiscard]] auto target_for_(const Plan& plan, const adapters::Location& source,
                                   const adapters::ObjectInfo& object) const -> adapters::Location;

    adapters::StorageClient& client_;
    extensions::Session& session_;
};

} // namespace objcp::core
