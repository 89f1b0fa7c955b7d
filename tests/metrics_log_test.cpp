#include "summary/metrics_log.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace capture_bench;

namespace {

std::optional<MetricsLog> parseText(const std::string& text, std::string& error) {
    std::istringstream in(text);
    return MetricsLogReader::parse(in, error);
}

} // namespace

TEST(MetricsLogReader, ParsesSamplerOutput) {
    std::string error;
    auto log = parseText("timestamp,cpu_percent,mem_used_mb,disk_write_kbps\n"
                         "1700000001,12.5,512,3.0\n"
                         "1700000002,20.0,530,0.0\n", error);
    ASSERT_TRUE(log.has_value()) << error;
    ASSERT_EQ(log->samples.size(), 2u);
    EXPECT_DOUBLE_EQ(*log->samples[0].timestamp, 1700000001.0);
    EXPECT_DOUBLE_EQ(*log->samples[0].cpu_percent, 12.5);
    EXPECT_DOUBLE_EQ(*log->samples[1].mem_used_mb, 530.0);
    EXPECT_DOUBLE_EQ(*log->samples[1].disk_write_kbps, 0.0);
}

TEST(MetricsLogReader, ColumnsFoundByName) {
    std::string error;
    auto log = parseText("disk_write_kbps,mem_used_mb,extra,cpu_percent\n"
                         "7.5,100,x,42\n", error);
    ASSERT_TRUE(log.has_value()) << error;
    ASSERT_EQ(log->samples.size(), 1u);
    EXPECT_DOUBLE_EQ(*log->samples[0].cpu_percent, 42.0);
    EXPECT_DOUBLE_EQ(*log->samples[0].mem_used_mb, 100.0);
    EXPECT_DOUBLE_EQ(*log->samples[0].disk_write_kbps, 7.5);
    EXPECT_FALSE(log->samples[0].timestamp.has_value());
}

TEST(MetricsLogReader, EmptyAndMissingCellsStayUnset) {
    std::string error;
    auto log = parseText("timestamp,cpu_percent,mem_used_mb,disk_write_kbps\n"
                         "1,,512,nan\n"
                         "\n"
                         "2,5.0\n", error);
    ASSERT_TRUE(log.has_value()) << error;
    ASSERT_EQ(log->samples.size(), 2u);
    EXPECT_FALSE(log->samples[0].cpu_percent.has_value());
    EXPECT_FALSE(log->samples[0].disk_write_kbps.has_value());
    EXPECT_TRUE(log->samples[1].cpu_percent.has_value());
    EXPECT_FALSE(log->samples[1].mem_used_mb.has_value());
}

TEST(MetricsLogReader, HeaderOnlyHasNoSamples) {
    std::string error;
    auto log = parseText("timestamp,cpu_percent,mem_used_mb,disk_write_kbps\n", error);
    ASSERT_TRUE(log.has_value()) << error;
    EXPECT_TRUE(log->samples.empty());
}

TEST(MetricsLogReader, Errors) {
    std::string error;

    EXPECT_FALSE(parseText("", error).has_value());
    EXPECT_EQ(error, "file is empty");

    EXPECT_FALSE(parseText("timestamp,cpu_percent,disk_write_kbps\n1,2,3\n", error).has_value());
    EXPECT_EQ(error, "missing column 'mem_used_mb'");

    EXPECT_FALSE(parseText("timestamp,cpu_percent,mem_used_mb,disk_write_kbps\n"
                           "1,abc,3,4\n", error).has_value());
    EXPECT_EQ(error, "line 2: non-numeric value 'abc' in column 'cpu_percent'");

    EXPECT_FALSE(parseText("timestamp,cpu_percent,mem_used_mb,disk_write_kbps\n"
                           "1,2,3,4,5\n", error).has_value());
    EXPECT_EQ(error, "line 2: expected 4 fields, saw 5");
}

TEST(MetricsLogReader, MissingFile) {
    std::string error;
    EXPECT_FALSE(MetricsLogReader::readFile("/nonexistent/job.log", error).has_value());
    EXPECT_EQ(error, "cannot open file");
}
