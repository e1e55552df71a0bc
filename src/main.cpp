#include <filesystem>
#include <memory>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "infra/config/config.hpp"
#include "infra/duration/duration.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "cli/printer/json_reporter.hpp"
#include "adapters/fs/local_client.hpp"
#include "extensions/metadata.hpp"
#include "extensions/session/session.hpp"
#include "core/controller/reporter.hpp"
#include "core/controller/run_controller.hpp"

using ARGS = objcp::args_parser::CLIArgs;
using CONFIG = objcp::infra::Config;

constexpr auto load_from_cli = objcp::infra::config_from_cli;
constexpr auto load_config_file = objcp::infra::load_config_from_file;
constexpr auto args_parser = objcp::args_parser::parse_args;

namespace {

auto report_error(const CONFIG& config, objcp::infra::Error error) -> int {
    const int code = error.to_exit_code();
    if (config.json) {
        objcp::cli::print_json_error(error);
    } else {
        (void)objcp::infra::log_and_return(std::move(error));
    }
    return code;
}

void print_resume_hint(const std::filesystem::path& dir, const std::string& id) {
    if (!objcp::extensions::session_exists(dir, id)) return;
    fmt::print(stderr, "Session `{}` is saved. To continue use `objcp session resume {}`\n", id, id);
}

// Прогон сессии до конца; возвращает код выхода
auto run_session(const CONFIG& config, objcp::extensions::Session& session,
                 std::stop_token cancel) -> int
{
    objcp::adapters::fs::LocalClient client({
        .aliases = config.aliases,
        .verify = config.verify,
    });

    std::unique_ptr<objcp::core::Reporter> reporter;
    if (config.json) {
        reporter = std::make_unique<objcp::cli::JsonReporter>();
    } else {
        // Построчный вывод мешает полосе прогресса
        reporter = std::make_unique<objcp::core::LogReporter>(config.quiet || !config.progress);
    }

    const auto dir = config.effective_session_dir();
    const auto id = session.id();

    objcp::core::RunController controller(config, session, client, *reporter);
    auto result = controller.run(cancel);
    if (!result) {
        const int code = result.error().to_exit_code();
        if (result.error().is_interrupted()) {
            spdlog::warn("{}", result.error().message);
        } else {
            report_error(config, std::move(result.error()));
        }
        print_resume_hint(dir, id);
        return code;
    }
    return result->errors > 0 ? 1 : 0;
}

auto copy_command(const ARGS& args, const CONFIG& config, std::stop_token cancel) -> int {
    auto user_metadata = objcp::extensions::parse_user_metadata(args.attr);
    if (!user_metadata) {
        return report_error(config, objcp::infra::wrap_error(std::move(user_metadata.error()),
            fmt::format("Unable to parse attribute {}", args.attr)));
    }

    // Ошибки в длительностях видны до создания сессии
    if (auto filter = objcp::infra::AgeFilter::create(args.older_than, args.newer_than); !filter) {
        return report_error(config, std::move(filter.error()));
    }

    objcp::extensions::SessionHeader header;
    header.command_args = args.sources;
    header.command_args.push_back(args.target);
    header.options = {
        .recursive = args.recursive,
        .older_than = args.older_than,
        .newer_than = args.newer_than,
        .storage_class = args.storage_class,
        .encrypt_key = args.encrypt_key,
        .encrypt = args.encrypt,
    };
    header.user_metadata = std::move(*user_metadata);
    header.root_path = std::filesystem::current_path().string();

    auto session = objcp::extensions::Session::create(config.effective_session_dir(),
                                                      std::move(header));
    if (!session) {
        return report_error(config, std::move(session.error()));
    }
    spdlog::debug("Created session {}: {} -> {}", session->id(), args.sources, args.target);
    return run_session(config, *session, cancel);
}

auto resume_command(const ARGS& args, const CONFIG& config, std::stop_token cancel) -> int {
    auto session = objcp::extensions::Session::load(config.effective_session_dir(),
                                                    args.session_id);
    if (!session) {
        return report_error(config, std::move(session.error()));
    }

    // Относительные пути сессии разрешаются от каталога, где её создали
    std::error_code ec;
    std::filesystem::current_path(session->header().root_path, ec);
    if (ec) {
        return report_error(config, objcp::infra::make_error(objcp::infra::ErrorCode::SessionIO,
            fmt::format("Unable to change directory to {}: {}",
                        session->header().root_path, ec.message())));
    }
    return run_session(config, *session, cancel);
}

auto list_command(const CONFIG& config) -> int {
    auto headers = objcp::extensions::list_sessions(config.effective_session_dir());
    if (!headers) {
        return report_error(config, std::move(headers.error()));
    }
    for (const auto& header : *headers) {
        fmt::print("{} [{}] {} {}\n", header.id, header.created, header.command_type,
                   fmt::join(header.command_args, " "));
    }
    return 0;
}

auto clear_command(const ARGS& args, const CONFIG& config) -> int {
    const auto dir = config.effective_session_dir();
    if (args.clear_all) {
        if (auto res = objcp::extensions::clear_sessions(dir); !res) {
            return report_error(config, std::move(res.error()));
        }
        spdlog::info("All sessions cleared");
        return 0;
    }

    auto session = objcp::extensions::Session::load(dir, args.session_id);
    if (!session) {
        return report_error(config, std::move(session.error()));
    }
    if (auto res = session->remove(); !res) {
        return report_error(config, std::move(res.error()));
    }
    spdlog::info("Session `{}` cleared", args.session_id);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        objcp::infra::install_signal_handler();
        objcp::infra::InterruptWatcher watcher;

        int exit_code = 0;
        auto args_opt = args_parser(argc, argv, exit_code);
        if (!args_opt) {
            return exit_code; // --help, --version или ошибка
        }
        const auto& args = *args_opt;

        // 1. Загрузить из файла
        auto config_res = load_config_file(args.config_file);
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        if (config.json) {
            // stdout занят JSON-записями
            spdlog::set_default_logger(spdlog::stderr_color_mt("objcp"));
            spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
        }
        if (config.debug) {
            spdlog::set_level(spdlog::level::debug);
        } else if (config.quiet || config.json) {
            spdlog::set_level(spdlog::level::warn);
        }

        switch (args.command) {
            case objcp::args_parser::Command::Copy:
                return copy_command(args, config, watcher.token());
            case objcp::args_parser::Command::SessionResume:
                return resume_command(args, config, watcher.token());
            case objcp::args_parser::Command::SessionList:
                return list_command(config);
            case objcp::args_parser::Command::SessionClear:
                return clear_command(args, config);
        }
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
