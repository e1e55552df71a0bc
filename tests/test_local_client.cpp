#include <gtest/gtest.h>

#include <algorithm>
#include <vector>
#include "adapters/fs/local_client.hpp"
#include "extensions/metadata.hpp"
#include "temp_dir.hpp"

using objcp::adapters::Location;
using objcp::adapters::ObjectInfo;
using objcp::adapters::fs::CopyStrategy;
using objcp::adapters::fs::LocalClient;
using objcp::adapters::fs::select_strategy;
using objcp::infra::ErrorCode;
using objcp::testing::read_file;
using objcp::testing::write_file;

class LocalClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(dir_ / "src/a.txt", "alpha");
        write_file(dir_ / "src/nested/b.txt", "bravo!");
    }

    auto loc(const std::string& relative) const -> Location {
        return Location{.alias = {}, .path = (dir_ / relative).string()};
    }

    objcp::testing::TempDir dir_;
};

TEST(CopyStrategyTest, SmallFilesAreBuffered)
{
    EXPECT_EQ(select_strategy(0), CopyStrategy::Buffered);
    EXPECT_EQ(select_strategy(999'999), CopyStrategy::Buffered);
    EXPECT_EQ(select_strategy(1'000'000), CopyStrategy::MMap);
}

TEST_F(LocalClientTest, CopiesFileIntoNewFolder)
{
    LocalClient client;
    auto res = client.copy(loc("src/a.txt"), loc("out/deep/a.txt"), {}, {}, {});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(read_file(dir_ / "out/deep/a.txt"), "alpha");
    EXPECT_FALSE(std::filesystem::exists(dir_ / "out/deep/.a.txt.objcp.part"));
}

TEST_F(LocalClientTest, CopiesLargeFileWithMmap)
{
    std::string big(2 * 1024 * 1024, 'x');
    big[12345] = 'y';
    write_file(dir_ / "src/big.bin", big);

    LocalClient client({.aliases = {}, .verify = true});
    auto res = client.copy(loc("src/big.bin"), loc("out/big.bin"), {}, {}, {});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(read_file(dir_ / "out/big.bin"), big);
}

TEST_F(LocalClientTest, MissingSourceIsObjectNotFound)
{
    LocalClient client;
    auto res = client.copy(loc("src/missing.txt"), loc("out/missing.txt"), {}, {}, {});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ObjectNotFound);
    EXPECT_TRUE(res.error().is_ignorable());
}

TEST_F(LocalClientTest, StoppedCopyIsInterrupted)
{
    std::stop_source source;
    source.request_stop();

    LocalClient client;
    auto res = client.copy(loc("src/a.txt"), loc("out/a.txt"), {}, {}, source.get_token());
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::Interrupted);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "out/a.txt"));
}

TEST_F(LocalClientTest, UserMetadataIsStoredWhenSupported)
{
    LocalClient client;
    auto res = client.copy(loc("src/a.txt"), loc("out/a.txt"), {}, {{"owner", "ops"}}, {});
    ASSERT_TRUE(res.has_value()) << res.error().message;

    // tmpfs и часть ФС не поддерживают user xattr: тогда копия без атрибутов
    auto owner = objcp::extensions::read_user_metadata(dir_ / "out/a.txt", "owner");
    if (owner) {
        EXPECT_EQ(*owner, "ops");
    }
}

TEST_F(LocalClientTest, FolderWithoutRecursiveIsRejected)
{
    LocalClient client;
    auto res = client.list(loc("src"), false, {}, [](const ObjectInfo&) { return true; });
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::IsFolder);
}

TEST_F(LocalClientTest, RecursiveListVisitsAllFiles)
{
    LocalClient client;
    std::vector<std::string> seen;
    std::uint64_t bytes = 0;
    auto res = client.list(loc("src"), true, {}, [&](const ObjectInfo& info) {
        seen.push_back(std::filesystem::path(info.location.path).filename().string());
        bytes += info.size;
        return true;
    });
    ASSERT_TRUE(res.has_value()) << res.error().message;
    std::ranges::sort(seen);
    EXPECT_EQ(seen, (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(bytes, 11u);
}

TEST_F(LocalClientTest, MissingSourceListIsSourceNotFound)
{
    LocalClient client;
    auto res = client.list(loc("nope"), true, {}, [](const ObjectInfo&) { return true; });
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::SourceNotFound);
}

TEST_F(LocalClientTest, AliasesMapToRoots)
{
    LocalClient client({.aliases = {{"site", dir_.path()}}, .verify = false});

    const auto location = client.resolve("site/src/a.txt");
    EXPECT_EQ(location.alias, "site");
    EXPECT_EQ(location.path, "src/a.txt");

    auto info = client.stat(location);
    ASSERT_TRUE(info.has_value()) << info.error().message;
    EXPECT_EQ(info->size, 5u);
    EXPECT_FALSE(info->is_dir);

    const auto plain = client.resolve("other/a.txt");
    EXPECT_TRUE(plain.alias.empty());
    EXPECT_EQ(plain.path, "other/a.txt");
}
