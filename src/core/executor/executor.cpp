#include "executor.hpp"
#include <exception>
#include <memory>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace objcp::core {

TransferExecutor::TransferExecutor(std::size_t parallel)
    : pool_(parallel) {}

TransferExecutor::~TransferExecutor() {
    close();
}

auto TransferExecutor::submit(TransferJob job, std::stop_token stop) -> bool {
    // std::function требует копируемости, поэтому задача живёт в shared_ptr
    auto shared = std::make_shared<TransferJob>(std::move(job));
    return pool_.enqueue([this, shared]() {
        auto& job = *shared;
        try {
            job.run(job.unit);
        } catch (const std::exception& e) {
            job.unit.error = infra::make_error(infra::ErrorCode::Unknown,
                fmt::format("Failed to copy `{}`: {}", job.unit.id(), e.what()));
        }
        results_.push(Completion{
            .seq = job.seq,
            .unit = std::move(job.unit),
            .replayed = job.replayed,
        });
    }, stop);
}

void TransferExecutor::close() {
    std::call_once(closed_, [this] {
        pool_.shutdown();
        results_.close();
        spdlog::debug("Executor drained");
    });
}

auto make_copy_task(CopyContext context) -> TransferTask {
    return [ctx = std::move(context)](TransferUnit& unit) {
        if (unit.error) {
            return; // уже помечена как неудачная
        }

        // Свежие карты для каждой единицы, заголовок сессии не разделяется
        unit.target.metadata = {};
        unit.target.user_metadata = ctx.user_metadata;
        if (!ctx.storage_class.empty()) {
            unit.target.metadata[kStorageClassKey] = ctx.storage_class;
        }

        auto res = infra::with_retry([&]() {
            return ctx.client.copy(unit.source.location, unit.target.location,
                                   unit.target.metadata, unit.target.user_metadata,
                                   ctx.cancel);
        }, ctx.retry, ctx.cancel);

        if (!res) {
            unit.error = infra::wrap_error(std::move(res.error()),
                                           fmt::format("Failed to copy `{}`", unit.id()));
            return;
        }
        ctx.progress.add(unit.source.size);
    };
}

auto make_fake_task(infra::Progress& progress) -> TransferTask {
    return [&progress](TransferUnit& unit) {
        progress.add(unit.source.size);
    };
}

} // namespace objcp::core
