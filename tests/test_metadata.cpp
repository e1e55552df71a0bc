#include <gtest/gtest.h>

#include "extensions/metadata.hpp"
#include "temp_dir.hpp"

using objcp::extensions::parse_user_metadata;
using objcp::infra::ErrorCode;

TEST(UserMetadataTest, ParsesPairs)
{
    auto parsed = parse_user_metadata("Cache-Control=max-age=90;owner=ops");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->size(), 2u);
    EXPECT_EQ(parsed->at("Cache-Control"), "max-age=90");
    EXPECT_EQ(parsed->at("owner"), "ops");
}

TEST(UserMetadataTest, EmptyStringMeansNoMetadata)
{
    auto parsed = parse_user_metadata("");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->empty());
}

TEST(UserMetadataTest, RejectsMalformedEntries)
{
    for (auto text : {"novalue", "a=1;broken", "a=1;", "=value"}) {
        auto parsed = parse_user_metadata(text);
        ASSERT_FALSE(parsed.has_value()) << text;
        EXPECT_EQ(parsed.error().code, ErrorCode::InvalidMetadata) << text;
    }
}

TEST(FileMetadataTest, PreservesModificationTime)
{
    objcp::testing::TempDir dir;
    objcp::testing::write_file(dir / "src", "data");
    objcp::testing::write_file(dir / "dst", "data");

    const auto past = std::filesystem::last_write_time(dir / "src") - std::chrono::hours(48);
    std::filesystem::last_write_time(dir / "src", past);

    ASSERT_TRUE(objcp::extensions::copy_metadata(dir / "src", dir / "dst").has_value());
    EXPECT_EQ(std::filesystem::last_write_time(dir / "dst"), past);
}
