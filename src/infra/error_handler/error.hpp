#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace objcp::infra {

enum class ErrorCode {
    // Ошибки сканирования (сообщаем, продолжаем со следующим источником)
    SourceNotFound,
    IsFolder,

    // Ошибки отдельного объекта
    ObjectNotFound,     // ← ignorable: пропускаем и считаем
    PermissionDenied,
    ChecksumMismatch,
    StorageError,
    NetworkTimeout,     // ← transient, retry

    // Ошибки аргументов
    InvalidArgument,
    InvalidDuration,
    InvalidMetadata,

    // Сессия (всегда фатальны)
    SessionIO,
    SessionNotFound,
    CorruptSession,

    // Итог прогона
    Interrupted,

    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;
[[nodiscard]] auto error_code_from_string(std::string_view name) -> ErrorCode;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::NetworkTimeout;
    }

    // Не прерывает прогон: сообщаем, считаем, идём дальше
    [[nodiscard]] auto is_ignorable() const -> bool {
        return code == ErrorCode::ObjectNotFound;
    }

    [[nodiscard]] auto is_interrupted() const -> bool {
        return code == ErrorCode::Interrupted;
    }
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Добавляет контекст (например, url объекта) к сообщению, код сохраняется
[[nodiscard]] auto wrap_error(Error err, std::string_view context) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace objcp::infra
