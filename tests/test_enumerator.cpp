#include <gtest/gtest.h>

#include <vector>
#include "core/enumerator/enumerator.hpp"
#include "fake_storage.hpp"
#include "temp_dir.hpp"

using namespace std::chrono_literals;
using objcp::core::Enumerator;
using objcp::core::TransferUnit;
using objcp::extensions::Session;
using objcp::extensions::SessionHeader;
using objcp::infra::ErrorCode;
using objcp::testing::FakeStorage;

class EnumeratorTest : public ::testing::Test {
protected:
    auto make_session(std::vector<std::string> args, bool recursive = false) -> Session {
        SessionHeader header;
        header.command_args = std::move(args);
        header.options.recursive = recursive;
        auto session = Session::create(dir_.path(), std::move(header));
        EXPECT_TRUE(session.has_value());
        return std::move(*session);
    }

    static auto read_units(const Session& session) -> std::vector<TransferUnit> {
        std::vector<TransferUnit> units;
        auto reader = session.new_reader();
        EXPECT_TRUE(reader.has_value());
        while (auto line = reader->next()) {
            EXPECT_TRUE(line->has_value());
            if (*line) units.push_back(std::move(**line));
        }
        return units;
    }

    static auto targets(const std::vector<TransferUnit>& units) -> std::vector<std::string> {
        std::vector<std::string> result;
        for (const auto& unit : units) result.push_back(unit.target.location.path);
        return result;
    }

    objcp::testing::TempDir dir_;
    FakeStorage storage_;
};

TEST_F(EnumeratorTest, TotalsMatchWorkLog)
{
    storage_.add("a.txt", 10);
    storage_.add("b.txt", 20);
    auto session = make_session({"a.txt", "b.txt", "dest/"});

    auto stats = Enumerator(storage_, session).run({});
    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(stats->objects, 2u);
    EXPECT_EQ(stats->bytes, 30u);

    const auto units = read_units(session);
    EXPECT_EQ(units.size(), session.header().total_objects);
    EXPECT_EQ(session.header().total_bytes, 30u);
    EXPECT_TRUE(session.header().scan_complete);
    EXPECT_EQ(targets(units), (std::vector<std::string>{"dest/a.txt", "dest/b.txt"}));
}

TEST_F(EnumeratorTest, SingleFileToFileTarget)
{
    storage_.add("a.txt", 10);
    auto session = make_session({"a.txt", "copy.txt"});

    ASSERT_TRUE(Enumerator(storage_, session).run({}).has_value());
    EXPECT_EQ(targets(read_units(session)), (std::vector<std::string>{"copy.txt"}));
}

TEST_F(EnumeratorTest, ExistingFolderTargetGetsBaseName)
{
    storage_.add("data/a.txt", 10);
    storage_.add_dir("dest");
    auto session = make_session({"data/a.txt", "dest"});

    ASSERT_TRUE(Enumerator(storage_, session).run({}).has_value());
    EXPECT_EQ(targets(read_units(session)), (std::vector<std::string>{"dest/a.txt"}));
}

TEST_F(EnumeratorTest, FolderWithoutRecursiveIsAnError)
{
    storage_.add("dir/a.txt", 10);
    storage_.add("b.txt", 5);
    auto session = make_session({"dir", "b.txt", "dest/"});

    auto stats = Enumerator(storage_, session).run({});
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->errors, 1u);
    EXPECT_EQ(stats->objects, 1u);
    EXPECT_EQ(targets(read_units(session)), (std::vector<std::string>{"dest/b.txt"}));
}

TEST_F(EnumeratorTest, MissingSourceIsCountedAndSkipped)
{
    storage_.add("b.txt", 5);
    auto session = make_session({"nope.txt", "b.txt", "dest/"});

    auto stats = Enumerator(storage_, session).run({});
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->errors, 1u);
    EXPECT_EQ(stats->objects, 1u);
}

TEST_F(EnumeratorTest, RecursiveFolderKeepsFolderName)
{
    storage_.add("dir/a.txt", 1);
    storage_.add("dir/sub/b.txt", 2);
    auto session = make_session({"dir", "dest/"}, true);

    ASSERT_TRUE(Enumerator(storage_, session).run({}).has_value());
    EXPECT_EQ(targets(read_units(session)),
              (std::vector<std::string>{"dest/dir/a.txt", "dest/dir/sub/b.txt"}));
}

TEST_F(EnumeratorTest, TrailingSlashCopiesContents)
{
    storage_.add("dir/a.txt", 1);
    storage_.add("dir/sub/b.txt", 2);
    auto session = make_session({"dir/", "dest"}, true);

    ASSERT_TRUE(Enumerator(storage_, session).run({}).has_value());
    EXPECT_EQ(targets(read_units(session)),
              (std::vector<std::string>{"dest/a.txt", "dest/sub/b.txt"}));
}

TEST_F(EnumeratorTest, AgeFilterSkipsObjects)
{
    const auto now = std::chrono::system_clock::now();
    storage_.add("dir/old.txt", 1, now - std::chrono::days(10));
    storage_.add("dir/new.txt", 2, now - 1h);

    SessionHeader header;
    header.command_args = {"dir/", "dest/"};
    header.options.recursive = true;
    header.options.older_than = "7d";
    auto session = Session::create(dir_.path(), std::move(header));
    ASSERT_TRUE(session.has_value());

    auto stats = Enumerator(storage_, *session).run({});
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->objects, 1u);
    EXPECT_EQ(stats->skipped, 1u);
    EXPECT_EQ(targets(read_units(*session)), (std::vector<std::string>{"dest/old.txt"}));
}

TEST_F(EnumeratorTest, InvalidDurationFailsTheScan)
{
    storage_.add("a.txt", 1);
    SessionHeader header;
    header.command_args = {"a.txt", "dest/"};
    header.options.newer_than = "soon";
    auto session = Session::create(dir_.path(), std::move(header));
    ASSERT_TRUE(session.has_value());

    auto stats = Enumerator(storage_, *session).run({});
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::InvalidDuration);
}

TEST_F(EnumeratorTest, StopInterruptsScan)
{
    for (int i = 0; i < 10; ++i) {
        storage_.add("dir/f" + std::to_string(i), 1);
    }
    auto session = make_session({"dir/", "dest/"}, true);

    std::stop_source stop;
    int visited = 0;
    storage_.on_list([&](const objcp::adapters::ObjectInfo&) {
        if (++visited == 3) stop.request_stop();
    });

    auto stats = Enumerator(storage_, session).run(stop.get_token());
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::Interrupted);
    EXPECT_FALSE(session.header().scan_complete);
}
