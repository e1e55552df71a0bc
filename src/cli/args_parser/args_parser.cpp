#include "args_parser.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <git_info.hpp>

namespace objcp::args_parser {

namespace {

auto version_string() -> std::string {
    constexpr auto git = build_info::get_git_info();
    return fmt::format("objcp {} ({}{}) built {}",
                       git.branch, git.commit_short, git.dirty ? ", dirty" : "", git.timestamp);
}

} // namespace

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    CLIArgs args;
    std::vector<std::string> paths;
    std::uint32_t parallel = 0;
    std::string config_file;

    CLI::App app{"Resumable parallel object copy", "objcp"};
    app.set_version_flag("--version", version_string());
    app.require_subcommand(1);
    app.fallthrough(); // глобальные флаги допустимы после подкоманды

    app.add_flag("-q,--quiet", args.quiet, "Suppress progress and per-object output");
    app.add_flag("--json", args.json, "Print one JSON record per line");
    app.add_flag("--no-progress", args.no_progress, "Disable the progress bar");
    app.add_flag("--debug", args.debug, "Enable debug logging");
    auto* parallel_opt = app.add_option("--parallel", parallel, "Number of concurrent copies")
        ->check(CLI::PositiveNumber);
    auto* config_opt = app.add_option("--config", config_file, "Configuration file")
        ->check(CLI::ExistingFile);

    // cp
    auto* cp = app.add_subcommand("cp", "Copy objects, resumable on failure or interrupt");
    cp->add_option("paths", paths, "SOURCE... TARGET")->required()->expected(2, -1);
    cp->add_flag("-r,--recursive", args.recursive, "Copy recursively");
    cp->add_option("--older-than", args.older_than, "Copy objects older than e.g. 7d10h31s");
    cp->add_option("--newer-than", args.newer_than, "Copy objects newer than e.g. 7d10h31s");
    cp->add_option("--storage-class,--sc", args.storage_class, "Storage class for new objects");
    cp->add_option("--attr", args.attr, "Custom metadata: key1=value1;key2=value2");
    cp->add_option("--encrypt", args.encrypt, "Encrypt objects under these prefixes")
        ->envname("OBJCP_ENCRYPT");
    cp->add_option("--encrypt-key", args.encrypt_key, "Encryption keys: prefix=key,...")
        ->envname("OBJCP_ENCRYPT_KEY");

    // session
    auto* session = app.add_subcommand("session", "Manage unfinished sessions");
    session->require_subcommand(1);
    auto* list = session->add_subcommand("list", "List unfinished sessions");
    auto* resume = session->add_subcommand("resume", "Resume an unfinished session");
    resume->add_option("id", args.session_id, "Session id")->required();
    auto* clear = session->add_subcommand("clear", "Remove unfinished sessions");
    auto* clear_id = clear->add_option("id", args.session_id, "Session id");
    auto* clear_all = clear->add_flag("--all", args.clear_all, "Remove all sessions");
    clear_id->excludes(clear_all);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e);
        return std::nullopt;
    }

    if (cp->parsed()) {
        args.command = Command::Copy;
        args.target = paths.back();
        paths.pop_back();
        args.sources = std::move(paths);
    } else if (list->parsed()) {
        args.command = Command::SessionList;
    } else if (resume->parsed()) {
        args.command = Command::SessionResume;
    } else if (clear->parsed()) {
        if (args.session_id.empty() && !args.clear_all) {
            fmt::print(stderr, "session clear: expected a session id or --all\n");
            exit_code = 1;
            return std::nullopt;
        }
        args.command = Command::SessionClear;
    }

    if (parallel_opt->count() > 0) args.parallel = parallel;
    if (config_opt->count() > 0) args.config_file = config_file;

    exit_code = 0;
    return args;
}

} // namespace objcp::args_parser
