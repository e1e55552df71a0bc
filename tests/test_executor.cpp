#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>
#include "core/executor/executor.hpp"
#include "fake_storage.hpp"

using namespace std::chrono_literals;
using objcp::core::Completion;
using objcp::core::CopyContext;
using objcp::core::TransferExecutor;
using objcp::core::TransferJob;
using objcp::core::TransferUnit;
using objcp::infra::Accounter;
using objcp::infra::ErrorCode;
using objcp::testing::FakeStorage;

namespace {

auto unit_for(const std::string& path, std::uint64_t size) -> TransferUnit {
    TransferUnit unit;
    unit.source.location = {.alias = "", .path = path};
    unit.source.size = size;
    unit.target.location = {.alias = "", .path = "dest/" + path};
    return unit;
}

auto drain(TransferExecutor& executor) -> std::vector<Completion> {
    std::vector<Completion> results;
    while (auto completion = executor.results().pop()) {
        results.push_back(std::move(*completion));
    }
    return results;
}

} // namespace

TEST(TransferExecutorTest, OneResultPerTask)
{
    TransferExecutor executor(4);
    std::atomic<int> runs{0};

    std::jthread feeder([&] {
        for (std::uint64_t seq = 0; seq < 50; ++seq) {
            ASSERT_TRUE(executor.submit(TransferJob{
                .seq = seq,
                .unit = unit_for("f" + std::to_string(seq), 1),
                .run = [&runs](TransferUnit&) { ++runs; },
            }));
        }
        executor.close();
    });

    const auto results = drain(executor);
    feeder.join();

    EXPECT_EQ(results.size(), 50u);
    EXPECT_EQ(runs.load(), 50);
    std::set<std::uint64_t> seqs;
    for (const auto& completion : results) seqs.insert(completion.seq);
    EXPECT_EQ(seqs.size(), 50u);
}

TEST(TransferExecutorTest, InFlightIsBounded)
{
    constexpr std::size_t kParallel = 3;
    TransferExecutor executor(kParallel);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::jthread feeder([&] {
        for (std::uint64_t seq = 0; seq < 30; ++seq) {
            ASSERT_TRUE(executor.submit(TransferJob{
                .seq = seq,
                .unit = unit_for("f", 1),
                .run = [&](TransferUnit&) {
                    const int now = ++running;
                    int prev = peak.load();
                    while (prev < now && !peak.compare_exchange_weak(prev, now)) {}
                    std::this_thread::sleep_for(2ms);
                    --running;
                },
            }));
        }
        executor.close();
    });

    drain(executor);
    feeder.join();
    EXPECT_LE(peak.load(), static_cast<int>(kParallel));
    EXPECT_GE(peak.load(), 1);
}

TEST(TransferExecutorTest, ThrowingTaskBecomesUnitError)
{
    TransferExecutor executor(1);
    ASSERT_TRUE(executor.submit(TransferJob{
        .seq = 0,
        .unit = unit_for("boom", 1),
        .run = [](TransferUnit&) { throw std::runtime_error("kaboom"); },
    }));
    executor.close();

    const auto results = drain(executor);
    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].unit.error.has_value());
    EXPECT_EQ(results[0].unit.error->code, ErrorCode::Unknown);
}

TEST(TransferExecutorTest, StoppedSubmitIsRejected)
{
    TransferExecutor executor(1);
    std::stop_source release;

    ASSERT_TRUE(executor.submit(TransferJob{
        .seq = 0,
        .unit = unit_for("slow", 1),
        .run = [token = release.get_token()](TransferUnit&) {
            while (!token.stop_requested()) std::this_thread::sleep_for(1ms);
        },
    }));

    // Единственный слот занят: отменённая подача не должна ждать
    std::stop_source cancel;
    cancel.request_stop();
    EXPECT_FALSE(executor.submit(TransferJob{.seq = 1, .unit = unit_for("x", 1),
                                             .run = [](TransferUnit&) {}},
                                 cancel.get_token()));

    release.request_stop();
    executor.close();
    EXPECT_EQ(drain(executor).size(), 1u);
}

TEST(CopyTaskTest, CopiesWithMetadataAndCountsProgress)
{
    FakeStorage storage;
    storage.add("a.txt", 10);
    Accounter progress;

    auto task = objcp::core::make_copy_task(CopyContext{
        .client = storage,
        .progress = progress,
        .storage_class = "REDUCED_REDUNDANCY",
        .user_metadata = {{"owner", "ops"}},
        .retry = {},
        .cancel = {},
    });

    auto unit = unit_for("a.txt", 10);
    task(unit);
    EXPECT_FALSE(unit.error.has_value());
    EXPECT_EQ(progress.summary().bytes, 10u);
    EXPECT_EQ(progress.summary().objects, 1u);
    EXPECT_EQ(storage.last_metadata().at(objcp::core::kStorageClassKey), "REDUCED_REDUNDANCY");
    EXPECT_EQ(storage.last_user_metadata().at("owner"), "ops");
}

TEST(CopyTaskTest, TransientErrorsAreRetried)
{
    FakeStorage storage;
    storage.add("a.txt", 10);
    Accounter progress;

    std::atomic<int> calls{0};
    storage.on_copy([&](const objcp::adapters::Location&, std::stop_token)
                        -> std::optional<objcp::infra::Error> {
        if (++calls < 3) {
            return objcp::infra::make_error(ErrorCode::NetworkTimeout, "timeout");
        }
        return std::nullopt;
    });

    auto task = objcp::core::make_copy_task(CopyContext{
        .client = storage,
        .progress = progress,
        .storage_class = {},
        .user_metadata = {},
        .retry = {.max_attempts = 3, .initial_delay = 1ms},
        .cancel = {},
    });

    auto unit = unit_for("a.txt", 10);
    task(unit);
    EXPECT_FALSE(unit.error.has_value());
    EXPECT_EQ(calls.load(), 3);
    EXPECT_EQ(progress.summary().objects, 1u);
}

TEST(CopyTaskTest, FailureIsRecordedOnUnit)
{
    FakeStorage storage;
    storage.add("a.txt", 10);
    storage.fail("a.txt", ErrorCode::PermissionDenied);
    Accounter progress;

    auto task = objcp::core::make_copy_task(CopyContext{
        .client = storage,
        .progress = progress,
        .storage_class = {},
        .user_metadata = {},
        .retry = {},
        .cancel = {},
    });

    auto unit = unit_for("a.txt", 10);
    task(unit);
    ASSERT_TRUE(unit.error.has_value());
    EXPECT_EQ(unit.error->code, ErrorCode::PermissionDenied);
    EXPECT_NE(unit.error->message.find("a.txt"), std::string::npos);
    EXPECT_EQ(storage.copy_attempts(), 1);
    EXPECT_EQ(progress.summary().objects, 0u);
}

TEST(CopyTaskTest, FakeTaskOnlyCountsProgress)
{
    FakeStorage storage;
    Accounter progress;
    auto task = objcp::core::make_fake_task(progress);

    auto unit = unit_for("a.txt", 42);
    task(unit);
    EXPECT_EQ(progress.summary().bytes, 42u);
    EXPECT_EQ(storage.copy_attempts(), 0);
}
