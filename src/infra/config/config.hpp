#pragma once

#include <string>
#include <map>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <chrono>

namespace objcp::args_parser {
    struct CLIArgs;
}

namespace objcp::infra {

struct Config {
    // Параллелизм
    std::optional<std::uint32_t> parallel;

    // Вывод
    bool quiet = false;
    bool json = false;
    bool progress = true;
    bool debug = false;

    // Поведение
    bool verify = false;
    int retry_attempts = 3;
    std::chrono::milliseconds retry_initial_delay{100};

    // Пути
    std::optional<std::filesystem::path> session_dir;
    std::map<std::string, std::filesystem::path> aliases; // alias -> корень

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    [[nodiscard]] auto effective_parallel() const -> std::uint32_t;
    [[nodiscard]] auto effective_session_dir() const -> std::filesystem::path;
};

/// Загружает конфигурацию из файла YAML.
/// Если explicit_path задан, читается только он (и он обязан существовать).
/// Иначе ищет файл в порядке:
///   1. ./.objcp.yaml
///   2. $XDG_CONFIG_HOME/objcp/config.yaml
///   3. ~/.config/objcp/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file(
    const std::optional<std::filesystem::path>& explicit_path = std::nullopt)
    -> std::expected<Config, std::string>;

/// Разбирает YAML-текст конфигурации (используется load_config_from_file)
[[nodiscard]] auto parse_config(const std::string& yaml_text)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

/// ~/.objcp/session или $XDG_CONFIG_HOME/objcp/session
[[nodiscard]] auto default_session_dir() -> std::filesystem::path;

} // namespace objcp::infra
