#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "cli/printer/json_reporter.hpp"

using objcp::core::RunSummary;
using objcp::core::TransferUnit;
using objcp::infra::ErrorCode;

namespace {

auto unit_for(const std::string& path, std::uint64_t size) -> TransferUnit {
    TransferUnit unit;
    unit.source.location = {.alias = "", .path = path};
    unit.source.size = size;
    unit.target.location = {.alias = "", .path = "dest/" + path};
    unit.total_count = 2;
    unit.total_size = 30;
    return unit;
}

} // namespace

class JsonReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        out_ = std::tmpfile();
        ASSERT_NE(out_, nullptr);
    }
    void TearDown() override {
        if (out_) std::fclose(out_);
    }

    // Каждая строка вывода должна быть самостоятельным JSON-объектом
    auto records() -> std::vector<nlohmann::json> {
        std::vector<nlohmann::json> parsed;
        std::rewind(out_);
        std::string line;
        for (int c = std::fgetc(out_); c != EOF; c = std::fgetc(out_)) {
            if (c != '\n') {
                line.push_back(static_cast<char>(c));
                continue;
            }
            parsed.push_back(nlohmann::json::parse(line));
            line.clear();
        }
        EXPECT_TRUE(line.empty()) << "unterminated record: " << line;
        return parsed;
    }

    std::FILE* out_ = nullptr;
};

TEST_F(JsonReporterTest, SuccessRecordCarriesTotals)
{
    objcp::cli::JsonReporter reporter(out_);
    reporter.transferred(unit_for("a.txt", 10));

    auto lines = records();
    ASSERT_EQ(lines.size(), 1u);
    const auto& record = lines[0];
    EXPECT_EQ(record["status"], "success");
    EXPECT_EQ(record["source"], "a.txt");
    EXPECT_EQ(record["target"], "dest/a.txt");
    EXPECT_EQ(record["size"], 10);
    EXPECT_EQ(record["totalCount"], 2);
    EXPECT_EQ(record["totalSize"], 30);
}

TEST_F(JsonReporterTest, ErrorRecordNamesCode)
{
    objcp::cli::JsonReporter reporter(out_);
    auto unit = unit_for("b.txt", 20);
    unit.error = objcp::infra::make_error(ErrorCode::PermissionDenied, "access denied");
    reporter.failed(unit);

    auto lines = records();
    ASSERT_EQ(lines.size(), 1u);
    const auto& record = lines[0];
    EXPECT_EQ(record["status"], "error");
    EXPECT_EQ(record["error"]["code"], "PermissionDenied");
    EXPECT_EQ(record["error"]["message"], "access denied");
    EXPECT_EQ(record["source"], "b.txt");
    EXPECT_EQ(record["target"], "dest/b.txt");
}

TEST_F(JsonReporterTest, SummaryIsTheLastRecord)
{
    objcp::cli::JsonReporter reporter(out_);
    reporter.transferred(unit_for("a.txt", 10));

    RunSummary summary;
    summary.bytes = 30;
    summary.objects = 2;
    summary.replayed = 1;
    summary.errors = 0;
    summary.total_bytes = 30;
    summary.total_objects = 2;
    summary.elapsed = std::chrono::milliseconds(1500);
    reporter.finished(summary);

    auto lines = records();
    ASSERT_EQ(lines.size(), 2u);
    const auto& record = lines[1];
    EXPECT_EQ(record["type"], "summary");
    EXPECT_EQ(record["status"], "success");
    EXPECT_EQ(record["transferred"], 30);
    EXPECT_EQ(record["objects"], 2);
    EXPECT_EQ(record["replayed"], 1);
    EXPECT_EQ(record["errors"], 0);
    EXPECT_EQ(record["totalCount"], 2);
    EXPECT_EQ(record["totalSize"], 30);
    EXPECT_DOUBLE_EQ(record["duration"].get<double>(), 1.5);
    EXPECT_DOUBLE_EQ(record["speed"].get<double>(), 20.0);
}

TEST_F(JsonReporterTest, SummaryWithErrorsIsMarkedAsError)
{
    objcp::cli::JsonReporter reporter(out_);
    RunSummary summary;
    summary.errors = 3;
    reporter.finished(summary);

    auto lines = records();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["status"], "error");
    EXPECT_EQ(lines[0]["errors"], 3);
    EXPECT_FALSE(lines[0].contains("speed"));
}
