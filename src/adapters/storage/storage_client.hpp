#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <stop_token>
#include "../../infra/error_handler/error.hpp"

namespace objcp::adapters {

using Metadata = std::map<std::string, std::string>;

// Адрес объекта: алиас конечной точки + путь внутри неё.
// Пустой алиас означает локальную ФС относительно рабочего каталога.
struct Location {
    std::string alias;
    std::string path;

    // Строковая форма: "alias/path" или просто "path"
    [[nodiscard]] auto url() const -> std::string;
    [[nodiscard]] auto is_dir_hint() const -> bool {
        return !path.empty() && path.back() == '/';
    }

    auto operator==(const Location&) const -> bool = default;
};

struct ObjectInfo {
    Location location;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point mod_time{};
    bool is_dir = false;
};

// "a/b" + "c" -> "a/b/c"; лишние разделители схлопываются
[[nodiscard]] auto join_path(std::string_view dir, std::string_view name) -> std::string;

// Последний компонент пути без завершающего '/'
[[nodiscard]] auto base_name(std::string_view path) -> std::string;

// Возвращает false, чтобы прекратить листинг
using ListVisitor = std::function<bool(const ObjectInfo&)>;

/// Доступ к хранилищу. Реализация протокола вне движка:
/// движок видит только эти три операции.
class StorageClient {
public:
    virtual ~StorageClient() = default;

    /// Обходит объекты под location. Каталог без recursive -> ErrorCode::IsFolder.
    /// При срабатывании stop возвращает ErrorCode::Interrupted.
    [[nodiscard]] virtual auto list(const Location& location, bool recursive,
                                    std::stop_token stop, const ListVisitor& visit)
        -> infra::VoidResult = 0;

    /// ObjectNotFound, если объекта нет
    [[nodiscard]] virtual auto stat(const Location& location)
        -> infra::Result<ObjectInfo> = 0;

    [[nodiscard]] virtual auto copy(const Location& source, const Location& target,
                                    const Metadata& metadata,
                                    const Metadata& user_metadata,
                                    std::stop_token stop) -> infra::VoidResult = 0;

    /// Разбирает аргумент командной строки в Location (распознаёт алиасы)
    [[nodiscard]] virtual auto resolve(std::string_view url) const -> Location = 0;
};

} // namespace objcp::adapters
