#include "enumerator.hpp"
#include <optional>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace objcp::core {

namespace {

// "dir" -> копируем сам каталог, "dir/" или "." -> его содержимое
auto folder_prefix(const adapters::Location& source) -> std::string {
    if (source.path.empty() || source.is_dir_hint()) return {};
    auto base = adapters::base_name(source.path);
    if (base == "." || base == "..") return {};
    return base;
}

} // namespace

Enumerator::Enumerator(adapters::StorageClient& client, extensions::Session& session)
    : client_(client), session_(session) {}

auto Enumerator::make_plan_() -> infra::Result<Plan> {
    const auto& header = session_.header();
    if (header.command_args.size() < 2) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            "at least one source and one target are required"));
    }

    auto filter = infra::AgeFilter::create(header.options.older_than, header.options.newer_than);
    if (!filter) {
        return std::unexpected(std::move(filter.error()));
    }

    Plan plan{.target = client_.resolve(header.command_args.back()), .filter = *filter};

    // Цель считается каталогом, если так сказано явно ('/'), если источников
    // несколько, если она уже существует как каталог или источник - каталог
    const auto source_count = header.command_args.size() - 1;
    plan.target_is_folder = plan.target.is_dir_hint() || source_count > 1;
    if (!plan.target_is_folder) {
        auto info = client_.stat(plan.target);
        plan.target_is_folder = info && info->is_dir;
    }
    if (!plan.target_is_folder) {
        auto info = client_.stat(client_.resolve(header.command_args.front()));
        plan.target_is_folder = info && info->is_dir;
    }
    return plan;
}

auto Enumerator::target_for_(const Plan& plan, const adapters::Location& source,
                             const adapters::ObjectInfo& object) const -> adapters::Location
{
    adapters::Location target{.alias = plan.target.alias, .path = plan.target.path};
    if (!plan.target_is_folder) {
        return target; // файл -> файл
    }

    const auto& path = object.location.path;
    if (path == source.path) {
        // источник - одиночный объект
        target.path = adapters::join_path(plan.target.path, adapters::base_name(path));
        return target;
    }

    std::string relative = path.starts_with(source.path) ? path.substr(source.path.size()) : path;
    while (!relative.empty() && relative.front() == '/') relative.erase(0, 1);
    target.path = adapters::join_path(
        plan.target.path, adapters::join_path(folder_prefix(source), relative));
    return target;
}

auto Enumerator::run(std::stop_token stop) -> infra::Result<ScanStats> {
    auto plan = make_plan_();
    if (!plan) {
        return std::unexpected(std::move(plan.error()));
    }

    const auto& header = session_.header();
    const auto& args = header.command_args;
    ScanStats stats;

    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (stop.stop_requested()) break;

        const auto source = client_.resolve(args[i]);
        std::optional<infra::Error> session_error;

        auto listed = client_.list(source, header.options.recursive, stop,
            [&](const adapters::ObjectInfo& object) {
                if (stop.stop_requested()) return false;

                // Пропускаем объекты вне диапазона --older-than / --newer-than
                if (plan->filter.skip(object.mod_time)) {
                    ++stats.skipped;
                    return true;
                }

                TransferUnit unit;
                unit.source_alias = source.alias;
                unit.target_alias = plan->target.alias;
                unit.source.location = object.location;
                unit.source.size = object.size;
                unit.source.mod_time = object.mod_time;
                unit.target.location = target_for_(*plan, source, object);

                if (auto res = session_.append_unit(unit); !res) {
                    session_error = std::move(res.error());
                    return false;
                }
                stats.bytes += object.size;
                ++stats.objects;
                spdlog::trace("Scanned {}", object.location.url());
                return true;
            });

        if (session_error) {
            return std::unexpected(std::move(*session_error));
        }
        if (!listed) {
            if (listed.error().is_interrupted()) break;
            ++stats.errors;
            if (listed.error().code == infra::ErrorCode::IsFolder) {
                (void)infra::log_and_return(infra::wrap_error(std::move(listed.error()),
                                                              "Folder cannot be copied"));
            } else {
                (void)infra::log_and_return(infra::wrap_error(std::move(listed.error()),
                                                              "Unable to prepare URL for copying"));
            }
        }
    }

    if (stop.stop_requested()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
            "Interrupted while scanning sources"));
    }

    if (auto res = session_.finalize_scan(stats.bytes, stats.objects); !res) {
        return std::unexpected(std::move(res.error()));
    }
    spdlog::debug("Scan finished: {} objects, {} bytes, {} filtered, {} errors",
                  stats.objects, stats.bytes, stats.skipped, stats.errors);
    return stats;
}

} // namespace objcp::core
