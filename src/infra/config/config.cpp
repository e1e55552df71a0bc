#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace objcp::infra {
    void Config::merge_with(const Config& other) {
        if (other.parallel) parallel = other.parallel;
        if (other.session_dir) session_dir = other.session_dir;
        if (other.quiet) quiet = true;
        if (other.json) json = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.debug) debug = true;
        if (other.verify) verify = true;

        for (const auto& [name, root] : other.aliases) {
            aliases[name] = root;
        }
    }

    auto Config::effective_parallel() const -> std::uint32_t {
        if (parallel && *parallel > 0) return *parallel;
        auto hw = std::thread::hardware_concurrency();
        return hw == 0 ? 4 : hw;
    }

    // Абсолютный путь: resume меняет текущий каталог на root_path сессии
    auto Config::effective_session_dir() const -> std::filesystem::path {
        auto dir = session_dir.value_or(default_session_dir());
        std::error_code ec;
        auto absolute = std::filesystem::absolute(dir, ec);
        return ec ? dir : absolute;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".objcp.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "objcp" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "objcp" / "config.yaml");
            }
        }

        return paths;
    }

    auto default_session_dir() -> std::filesystem::path {
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && *config_home) {
            return std::filesystem::path(config_home) / "objcp" / "session";
        }
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / ".objcp" / "session";
        }
        return std::filesystem::path(".objcp") / "session";
    }

    auto parse_config(const std::string& yaml_text) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::Load(yaml_text);
            Config cfg{};
            if (!config || config.IsNull()) return cfg;

            if (config["parallel"]) cfg.parallel = config["parallel"].as<std::uint32_t>();

            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["json"]) cfg.json = config["json"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["log_level"]) cfg.debug = config["log_level"].as<std::string>() == "debug";

            if (config["session_dir"]) {
                cfg.session_dir = std::filesystem::path(config["session_dir"].as<std::string>());
            }

            if (const auto retry = config["retry"]) {
                if (retry["attempts"]) cfg.retry_attempts = retry["attempts"].as<int>();
                if (retry["initial_delay_ms"]) {
                    cfg.retry_initial_delay = std::chrono::milliseconds(retry["initial_delay_ms"].as<long>());
                }
            }

            if (const auto aliases = config["aliases"]) {
                for (const auto& entry : aliases) {
                    cfg.aliases[entry.first.as<std::string>()] =
                        std::filesystem::path(entry.second.as<std::string>());
                }
            }
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(std::string(e.what()));
        }
    }

    auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path)
        -> std::expected<Config, std::string>
    {
        std::vector<std::filesystem::path> paths;
        if (explicit_path) {
            if (!std::filesystem::exists(*explicit_path)) {
                return std::unexpected(fmt::format("Config file {} does not exist", explicit_path->string()));
            }
            paths.push_back(*explicit_path);
        } else {
            paths = get_config_paths();
        }

        for (const auto& path : paths) {
            if (!std::filesystem::exists(path)) continue;

            std::ifstream in(path);
            if (!in) {
                return std::unexpected(fmt::format("Cannot read {}", path.string()));
            }
            std::stringstream buffer;
            buffer << in.rdbuf();

            auto cfg = parse_config(buffer.str());
            if (!cfg) {
                return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), cfg.error()));
            }
            spdlog::debug("Loaded config from {}", path.string());
            return cfg;
        }

        // Файл не найден — возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.parallel = args.parallel;
        cfg.quiet = args.quiet;
        cfg.json = args.json;
        cfg.progress = !args.no_progress;
        cfg.debug = args.debug;
        return cfg;
    }

} // namespace objcp::infra
