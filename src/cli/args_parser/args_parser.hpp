#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace objcp::args_parser {

enum class Command {
    Copy,           // objcp cp SOURCE... TARGET
    SessionList,    // objcp session list
    SessionResume,  // objcp session resume ID
    SessionClear,   // objcp session clear ID | --all
};

struct CLIArgs
{
    Command command{Command::Copy};

    // cp
    std::vector<std::string> sources;       // позиционные аргументы
    std::string target;                     // последний позиционный аргумент
    bool recursive{false};                  // -r, --recursive
    std::string older_than;                 // --older-than 7d10h
    std::string newer_than;                 // --newer-than 7d10h
    std::string storage_class;              // --storage-class, --sc
    std::string attr;                       // --attr "k1=v1;k2=v2"
    std::string encrypt;                    // --encrypt (или OBJCP_ENCRYPT)
    std::string encrypt_key;                // --encrypt-key (или OBJCP_ENCRYPT_KEY)

    // session
    std::string session_id;
    bool clear_all{false};                  // session clear --all

    // глобальные
    bool quiet{false};                      // -q, --quiet
    bool json{false};                       // --json
    bool no_progress{false};                // --no-progress
    bool debug{false};                      // --debug
    std::optional<std::uint32_t> parallel;  // --parallel=N
    std::optional<std::string> config_file; // --config FILE
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns nullopt when the program should exit (help, version or usage error);
/// exit_code receives the code to exit with.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace objcp::args_parser
