#include "reporter.hpp"
#include <spdlog/spdlog.h>

namespace objcp::core {

LogReporter::LogReporter(bool per_unit)
    : per_unit_(per_unit) {}

void LogReporter::transferred(const TransferUnit& unit) {
    if (!per_unit_) return;
    spdlog::info("`{}` -> `{}`", unit.source.location.url(), unit.target.location.url());
}

void LogReporter::failed(const TransferUnit& unit) {
    if (!unit.error) return;
    auto error = *unit.error;
    (void)infra::log_and_return(std::move(error));
}

void LogReporter::finished(const RunSummary& summary) {
    const double seconds = static_cast<double>(summary.elapsed.count()) / 1000.0;
    spdlog::info("Transferred {} objects, {} bytes ({:.2f} MB) in {:.2f} seconds",
                 summary.objects, summary.bytes,
                 static_cast<double>(summary.bytes) / 1024.0 / 1024.0, seconds);
    if (summary.replayed > 0) {
        spdlog::info("Already transferred in a previous run: {} objects", summary.replayed);
    }
    if (summary.errors > 0) {
        spdlog::warn("Errors: {}", summary.errors);
    }
    if (summary.bytes > 0 && seconds > 0) {
        spdlog::info("Average speed: {:.2f} MB/s",
                     static_cast<double>(summary.bytes) / 1024.0 / 1024.0 / seconds);
    }
}

} // namespace objcp::core
