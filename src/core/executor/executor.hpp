#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include "../../adapters/storage/storage_client.hpp"
#include "../../infra/channel/channel.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../../infra/retry.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"
#include "../transfer_unit/transfer_unit.hpp"

namespace objcp::core {

// Задача меняет единицу на месте: при неудаче выставляет unit.error
using TransferTask = std::function<void(TransferUnit&)>;

struct TransferJob {
    std::uint64_t seq = 0;      // позиция в журнале
    TransferUnit unit;
    bool replayed = false;      // уже выполнена в прошлом запуске
    TransferTask run;
};

struct Completion {
    std::uint64_t seq = 0;
    TransferUnit unit;
    bool replayed = false;
};

// Пул из P воркеров. Каждая принятая задача даёт ровно один Completion,
// порядок результатов не совпадает с порядком подачи.
class TransferExecutor {
public:
    explicit TransferExecutor(std::size_t parallel);
    ~TransferExecutor();

    TransferExecutor(const TransferExecutor&) = delete;
    TransferExecutor& operator=(const TransferExecutor&) = delete;

    /// Блокирует, пока заняты все P слотов. false, если stop сработал раньше.
    [[nodiscard]] auto submit(TransferJob job, std::stop_token stop = {}) -> bool;

    /// Перестаёт принимать задачи, дожидается выполняющихся и закрывает results()
    void close();

    [[nodiscard]] auto results() -> infra::Channel<Completion>& { return results_; }
    [[nodiscard]] auto parallel() const -> std::size_t { return pool_.size(); }

private:
    infra::Channel<Completion> results_;
    infra::ThreadPool pool_;
    std::once_flag closed_;
};

// Всё, что нужно реальной задаче копирования
struct CopyContext {
    adapters::StorageClient& client;
    infra::Progress& progress;
    std::string storage_class;
    adapters::Metadata user_metadata;   // копируется в каждую единицу
    infra::RetryPolicy retry;
    std::stop_token cancel;             // общая область отмены
};

inline constexpr const char* kStorageClassKey = "X-Amz-Storage-Class";

[[nodiscard]] auto make_copy_task(CopyContext context) -> TransferTask;

// Без ввода-вывода: только продвигает прогресс на размер единицы
[[nodiscard]] auto make_fake_task(infra::Progress& progress) -> TransferTask;

} // namespace objcp::core
