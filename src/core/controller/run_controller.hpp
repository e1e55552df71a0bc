#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include "../../adapters/storage/storage_client.hpp"
#include "../../extensions/session/session.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../executor/executor.hpp"
#include "reporter.hpp"

namespace objcp::core {

enum class RunState {
    Idle,
    ScanningRequired,
    Scanning,
    Resuming,
    Executing,
    Draining,
    Succeeded,
    Interrupted,
    Failed,
};

[[nodiscard]] auto to_string(RunState state) -> std::string_view;

// Насколько подача может уйти вперёд от контрольной точки, на один воркер.
// Ограничивает буфер подтверждений, когда ранняя единица долго висит.
inline constexpr std::uint64_t kCommitWindowPerWorker = 64;

// Предикат "уже выполнено": true для всех единиц журнала до контрольной
// точки включительно, false после неё. Вызывается в порядке журнала.
class ReplayFilter {
public:
    explicit ReplayFilter(std::string last_completed);

    [[nodiscard]] auto operator()(const std::string& unit_id) -> bool;

private:
    std::string last_completed_;
    bool passed_;
};

// Ведёт прогон сессии: сканирование, возобновление, выполнение, итог.
// Сессия удаляется при успехе и при прерывании сканирования, иначе остаётся
// для resume.
class RunController {
public:
    RunController(const infra::Config& config,
                  extensions::Session& session,
                  adapters::StorageClient& client,
                  Reporter& reporter);

    /// Interrupted, если сработал cancel; исходная ошибка при фатальном отказе.
    [[nodiscard]] auto run(std::stop_token cancel = {}) -> infra::Result<RunSummary>;

    [[nodiscard]] auto state() const -> RunState { return state_.load(); }

private:
    // Состояние слота журнала при подтверждении в порядке подачи
    struct Settled {
        std::string unit_id;
        bool replayed = false;
    };

    void transition_(RunState next);
    [[nodiscard]] auto scan_() -> infra::VoidResult;
    [[nodiscard]] auto execute_() -> infra::VoidResult;
    void feed_(std::stop_token stop, extensions::WorkLogReader& reader,
               TransferExecutor& executor, infra::Progress& progress);
    void handle_(Completion completion, std::jthread& feeder);
    void commit_(std::jthread& feeder);
    void fail_(infra::Error error, std::jthread& feeder);

    const infra::Config& config_;
    extensions::Session& session_;
    adapters::StorageClient& client_;
    Reporter& reporter_;

    std::atomic<RunState> state_{RunState::Idle};
    std::stop_source scope_;                     // общая область отмены

    // Пишутся только потоком контроллера
    std::map<std::uint64_t, Settled> pending_;
    std::uint64_t next_commit_ = 0;
    std::optional<infra::Error> fatal_;
    RunSummary summary_;

    // Окно подачи: feed_ ждёт, пока seq не войдёт в [committed_, committed_ + window_)
    std::mutex window_mutex_;
    std::condition_variable_any window_cv_;
    std::uint64_t committed_ = 0;
    std::uint64_t window_ = 0;

    // Пишутся только потоком подачи, читаются после join
    std::optional<infra::Error> feed_error_;
    std::uint64_t corrupt_lines_ = 0;
};

} // namespace objcp::core
