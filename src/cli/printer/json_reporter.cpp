#include "json_reporter.hpp"
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace objcp::cli {

namespace {

void emit(std::FILE* out, const nlohmann::json& record) {
    fmt::print(out, "{}\n", record.dump());
    std::fflush(out);
}

auto error_record(const infra::Error& error) -> nlohmann::json {
    return {
        {"status", "error"},
        {"error", {
            {"code", std::string(infra::to_string(error.code))},
            {"message", error.message},
        }},
    };
}

} // namespace

JsonReporter::JsonReporter(std::FILE* out)
    : out_(out) {}

void JsonReporter::transferred(const core::TransferUnit& unit) {
    emit(out_, {
        {"status", "success"},
        {"source", unit.source.location.url()},
        {"target", unit.target.location.url()},
        {"size", unit.source.size},
        {"totalCount", unit.total_count},
        {"totalSize", unit.total_size},
    });
}

void JsonReporter::failed(const core::TransferUnit& unit) {
    if (!unit.error) return;
    auto record = error_record(*unit.error);
    record["source"] = unit.source.location.url();
    record["target"] = unit.target.location.url();
    emit(out_, record);
}

void JsonReporter::finished(const core::RunSummary& summary) {
    const double seconds = static_cast<double>(summary.elapsed.count()) / 1000.0;
    nlohmann::json record = {
        {"status", summary.errors > 0 ? "error" : "success"},
        {"type", "summary"},
        {"transferred", summary.bytes},
        {"objects", summary.objects},
        {"replayed", summary.replayed},
        {"errors", summary.errors},
        {"totalCount", summary.total_objects},
        {"totalSize", summary.total_bytes},
        {"duration", seconds},
    };
    if (seconds > 0) {
        record["speed"] = static_cast<double>(summary.bytes) / seconds;
    }
    emit(out_, record);
}

void print_json_error(const infra::Error& error, std::FILE* out) {
    emit(out, error_record(error));
}

} // namespace objcp::cli
