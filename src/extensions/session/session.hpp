#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../../core/transfer_unit/transfer_unit.hpp"
#include "../../infra/error_handler/error.hpp"

namespace objcp::extensions {

// Типизированные флаги команды cp, фиксируются при создании сессии
struct CopyOptions {
    bool recursive = false;
    std::string older_than;
    std::string newer_than;
    std::string storage_class;
    std::string encrypt_key;
    std::string encrypt;
};

struct SessionHeader {
    static constexpr int kVersion = 1;

    int version = kVersion;
    std::string id;
    std::string command_type = "cp";
    std::vector<std::string> command_args;  // источники..., цель
    CopyOptions options;
    std::map<std::string, std::string> user_metadata;
    std::string root_path;
    std::string created;                    // ISO-8601 UTC

    // Выставляются один раз, когда сканирование завершено
    std::uint64_t total_bytes = 0;
    std::uint64_t total_objects = 0;
    bool scan_complete = false;

    // Контрольная точка: id последней подтверждённой единицы
    std::string last_completed;
};

// Последовательное чтение журнала работы
class WorkLogReader {
public:
    explicit WorkLogReader(std::ifstream stream, std::filesystem::path path);

    /// nullopt в конце журнала. Ошибка чтения -> SessionIO,
    /// неразборчивая строка -> CorruptSession (чтение можно продолжать).
    [[nodiscard]] auto next() -> std::optional<infra::Result<core::TransferUnit>>;

    [[nodiscard]] auto lines_read() const -> std::uint64_t { return lines_; }

private:
    std::ifstream stream_;
    std::filesystem::path path_;
    std::uint64_t lines_ = 0;
};

class Session {
public:
    Session(Session&&) noexcept = default;
    Session& operator=(Session&&) noexcept = default;
    ~Session();

    /// Новая сессия со случайным id; заголовок сразу сохраняется на диск
    [[nodiscard]] static auto create(const std::filesystem::path& dir, SessionHeader header)
        -> infra::Result<Session>;

    /// SessionNotFound, если такой сессии нет
    [[nodiscard]] static auto load(const std::filesystem::path& dir, const std::string& id)
        -> infra::Result<Session>;

    [[nodiscard]] auto id() const -> const std::string& { return header_.id; }
    [[nodiscard]] auto header() const -> const SessionHeader& { return header_; }
    [[nodiscard]] auto header_path() const -> std::filesystem::path;
    [[nodiscard]] auto data_path() const -> std::filesystem::path;

    /// Журнал есть и сканирование было доведено до конца
    [[nodiscard]] auto has_work_log() const -> bool;

    /// Обнуляет журнал (остаток прерванного сканирования)
    [[nodiscard]] auto reset_work_log() -> infra::VoidResult;

    [[nodiscard]] auto append_unit(const core::TransferUnit& unit) -> infra::VoidResult;

    /// Итоги сканирования: журнал fsync, заголовок сохраняется один раз
    [[nodiscard]] auto finalize_scan(std::uint64_t total_bytes, std::uint64_t total_objects)
        -> infra::VoidResult;

    [[nodiscard]] auto new_reader() const -> infra::Result<WorkLogReader>;

    /// Синхронно и атомарно: после возврата переживает завершение процесса
    [[nodiscard]] auto set_checkpoint(const std::string& unit_id) -> infra::VoidResult;

    [[nodiscard]] auto save() -> infra::VoidResult;

    /// Удаляет файлы сессии (успешное завершение или прерванное сканирование)
    [[nodiscard]] auto remove() -> infra::VoidResult;

    /// Аварийное завершение: сбросить всё на диск и оставить для resume
    [[nodiscard]] auto close() -> infra::VoidResult;

private:
    struct FileCloser {
        void operator()(std::FILE* file) const { std::fclose(file); }
    };
    using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

    Session(std::filesystem::path dir, SessionHeader header);

    [[nodiscard]] auto open_writer_() -> infra::VoidResult;
    [[nodiscard]] auto sync_writer_() -> infra::VoidResult;

    std::filesystem::path dir_;
    SessionHeader header_;
    FilePtr writer_;
};

/// Заголовки всех сохранённых сессий, старые первыми
[[nodiscard]] auto list_sessions(const std::filesystem::path& dir)
    -> infra::Result<std::vector<SessionHeader>>;

/// Удаляет все сессии в каталоге
[[nodiscard]] auto clear_sessions(const std::filesystem::path& dir) -> infra::VoidResult;

[[nodiscard]] auto session_exists(const std::filesystem::path& dir, const std::string& id) -> bool;

} // namespace objcp::extensions
