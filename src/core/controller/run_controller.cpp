#include "run_controller.hpp"
#include <chrono>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>
#include "../enumerator/enumerator.hpp"

namespace objcp::core {

auto to_string(RunState state) -> std::string_view {
    switch (state) {
        case RunState::Idle:             return "idle";
        case RunState::ScanningRequired: return "scanning-required";
        case RunState::Scanning:         return "scanning";
        case RunState::Resuming:         return "resuming";
        case RunState::Executing:        return "executing";
        case RunState::Draining:         return "draining";
        case RunState::Succeeded:        return "succeeded";
        case RunState::Interrupted:      return "interrupted";
        case RunState::Failed:           return "failed";
    }
    return "unknown";
}

ReplayFilter::ReplayFilter(std::string last_completed)
    : last_completed_(std::move(last_completed))
    , passed_(last_completed_.empty()) {}

auto ReplayFilter::operator()(const std::string& unit_id) -> bool {
    if (passed_) return false;
    if (unit_id == last_completed_) {
        passed_ = true; // сама контрольная точка тоже выполнена
    }
    return true;
}

RunController::RunController(const infra::Config& config,
                             extensions::Session& session,
                             adapters::StorageClient& client,
                             Reporter& reporter)
    : config_(config)
    , session_(session)
    , client_(client)
    , reporter_(reporter) {}

void RunController::transition_(RunState next) {
    const auto prev = state_.exchange(next);
    if (prev != next) {
        spdlog::debug("Session {}: {} -> {}", session_.id(), to_string(prev), to_string(next));
    }
}

auto RunController::scan_() -> infra::VoidResult {
    transition_(RunState::ScanningRequired);

    // Остаток журнала от сканирования, которое не дошло до конца
    if (auto res = session_.reset_work_log(); !res) {
        return std::unexpected(std::move(res.error()));
    }

    transition_(RunState::Scanning);
    Enumerator enumerator(client_, session_);
    auto stats = enumerator.run(scope_.get_token());
    if (!stats) {
        // Неполный журнал бесполезен для resume
        if (auto res = session_.remove(); !res) {
            (void)infra::log_and_return(std::move(res.error()));
        }
        return std::unexpected(std::move(stats.error()));
    }

    summary_.errors += stats->errors;
    spdlog::debug("Scanned {} objects ({} bytes) into session {}",
                  stats->objects, stats->bytes, session_.id());
    return {};
}

void RunController::feed_(std::stop_token stop, extensions::WorkLogReader& reader,
                          TransferExecutor& executor, infra::Progress& progress)
{
    const auto& header = session_.header();
    ReplayFilter replayed(header.last_completed);

    const auto copy = make_copy_task(CopyContext{
        .client = client_,
        .progress = progress,
        .storage_class = header.options.storage_class,
        .user_metadata = header.user_metadata,
        .retry = infra::RetryPolicy{
            .max_attempts = config_.retry_attempts,
            .initial_delay = config_.retry_initial_delay,
        },
        .cancel = scope_.get_token(),
    });
    const auto fake = make_fake_task(progress);

    std::uint64_t seq = 0;
    while (!stop.stop_requested()) {
        auto line = reader.next();
        if (!line) break; // конец журнала

        if (!*line) {
            if (line->error().code == infra::ErrorCode::CorruptSession) {
                ++corrupt_lines_;
                (void)infra::log_and_return(std::move(line->error()));
                continue;
            }
            feed_error_ = std::move(line->error());
            break;
        }

        auto unit = std::move(**line);
        unit.total_count = header.total_objects;
        unit.total_size = header.total_bytes;

        {
            std::unique_lock lock(window_mutex_);
            if (!window_cv_.wait(lock, stop, [&] { return seq < committed_ + window_; })) {
                break; // отменено, пока ждали подтверждений
            }
        }

        const bool is_replayed = replayed(unit.id());
        TransferJob job{
            .seq = seq,
            .unit = std::move(unit),
            .replayed = is_replayed,
            .run = is_replayed ? fake : copy,
        };
        if (!executor.submit(std::move(job), stop)) {
            break; // отменено, пока ждали слот
        }
        ++seq;
    }

    executor.close();
}

void RunController::fail_(infra::Error error, std::jthread& feeder) {
    if (!fatal_) {
        fatal_ = std::move(error);
    }
    feeder.request_stop();
    transition_(RunState::Draining);
}

void RunController::handle_(Completion completion, std::jthread& feeder) {
    auto& unit = completion.unit;

    if (completion.replayed) {
        ++summary_.replayed;
        pending_.emplace(completion.seq, Settled{unit.id(), true});
        commit_(feeder);
        return;
    }

    if (unit.error) {
        // После отмены любая ошибка вызвана ею
        if (unit.error->is_interrupted() || scope_.stop_requested()) {
            // Не подтверждаем: будет повторена при resume
            scope_.request_stop();
            return;
        }
        ++summary_.errors;
        reporter_.failed(unit);
        if (unit.error->is_fatal()) {
            fail_(*unit.error, feeder);
            return;
        }
        // Игнорируемая ошибка: единица считается разрешённой
    } else {
        reporter_.transferred(unit);
    }

    pending_.emplace(completion.seq, Settled{unit.id(), false});
    commit_(feeder);
}

void RunController::commit_(std::jthread& feeder) {
    std::string last_id;
    bool advanced = false;

    // Контрольная точка двигается только по непрерывному префиксу журнала
    for (auto it = pending_.find(next_commit_); it != pending_.end();
         it = pending_.find(next_commit_)) {
        if (!it->second.replayed) {
            advanced = true;
        }
        last_id = std::move(it->second.unit_id);
        pending_.erase(it);
        ++next_commit_;
    }

    {
        std::lock_guard lock(window_mutex_);
        committed_ = next_commit_;
    }
    window_cv_.notify_all();

    if (!advanced) return;
    if (auto res = session_.set_checkpoint(last_id); !res) {
        fail_(infra::wrap_error(std::move(res.error()), "Unable to save session checkpoint"),
              feeder);
    }
}

auto RunController::execute_() -> infra::VoidResult {
    transition_(RunState::Resuming);
    const auto& header = session_.header();

    auto reader = session_.new_reader();
    if (!reader) {
        return std::unexpected(std::move(reader.error()));
    }
    if (!header.last_completed.empty()) {
        spdlog::debug("Resuming session {} after `{}`", session_.id(), header.last_completed);
    }

    auto progress = infra::make_progress(config_, header.total_bytes);
    TransferExecutor executor(config_.effective_parallel());
    {
        std::lock_guard lock(window_mutex_);
        committed_ = 0;
        window_ = kCommitWindowPerWorker * executor.parallel();
    }

    transition_(RunState::Executing);
    std::jthread feeder([&](std::stop_token st) {
        feed_(st, *reader, executor, *progress);
    });

    // Прерывание останавливает и подачу новых единиц
    std::stop_callback stop_feeding(scope_.get_token(), [&feeder] {
        feeder.request_stop();
    });

    while (auto completion = executor.results().pop()) {
        if (scope_.stop_requested() && state() == RunState::Executing) {
            transition_(RunState::Draining);
        }
        handle_(std::move(*completion), feeder);
    }

    feeder.join();
    progress->finish();

    const auto done = progress->summary();
    summary_.bytes = done.bytes;
    summary_.objects = done.objects;
    summary_.errors += corrupt_lines_;

    if (feed_error_ && !fatal_) {
        fatal_ = infra::wrap_error(std::move(*feed_error_), "Unable to read session work log");
    }
    return {};
}

auto RunController::run(std::stop_token cancel) -> infra::Result<RunSummary> {
    const auto started = std::chrono::steady_clock::now();
    std::stop_callback link(cancel, [this] { scope_.request_stop(); });

    summary_ = RunSummary{};
    pending_.clear();
    next_commit_ = 0;
    fatal_.reset();
    feed_error_.reset();
    corrupt_lines_ = 0;

    if (!session_.has_work_log()) {
        if (auto res = scan_(); !res) {
            transition_(res.error().is_interrupted() ? RunState::Interrupted : RunState::Failed);
            return std::unexpected(std::move(res.error()));
        }
    }

    summary_.total_bytes = session_.header().total_bytes;
    summary_.total_objects = session_.header().total_objects;

    if (auto res = execute_(); !res) {
        fatal_ = std::move(res.error());
    }
    summary_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (fatal_) {
        transition_(RunState::Failed);
        if (auto res = session_.close(); !res) {
            (void)infra::log_and_return(std::move(res.error()));
        }
        return std::unexpected(std::move(*fatal_));
    }

    if (scope_.stop_requested()) {
        transition_(RunState::Interrupted);
        if (auto res = session_.close(); !res) {
            (void)infra::log_and_return(std::move(res.error()));
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
            "Interrupted while copying"));
    }

    transition_(RunState::Succeeded);
    if (auto res = session_.remove(); !res) {
        (void)infra::log_and_return(std::move(res.error()));
    }
    reporter_.finished(summary_);
    return summary_;
}

} // namespace objcp::core
