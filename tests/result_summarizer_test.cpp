#include "summary/result_summarizer.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace capture_bench;

namespace {

const std::string kHeader = "timestamp,cpu_percent,mem_used_mb,disk_write_kbps\n";

void writeLog(const test::TempDir& dir, const std::string& name,
              std::initializer_list<double> cpu_values) {
    std::string content = kHeader;
    long timestamp = 1700000000;
    for (double cpu : cpu_values) {
        content += std::to_string(++timestamp) + "," + std::to_string(cpu) + ",512,4.0\n";
    }
    test::writeFile(dir.file(name), content);
}

} // namespace

TEST(ResultSummarizer, EmptyDirectory) {
    test::TempDir dir;
    SummaryReport report = ResultSummarizer(dir.path().string()).summarize();
    EXPECT_EQ(report.log_count, 0u);
    EXPECT_TRUE(report.entries.empty());
    EXPECT_TRUE(report.errors.empty());
}

TEST(ResultSummarizer, MissingDirectoryHasNoLogs) {
    SummaryReport report = ResultSummarizer("/nonexistent/results").summarize();
    EXPECT_EQ(report.log_count, 0u);
}

TEST(ResultSummarizer, AveragesAndMaxima) {
    test::TempDir dir;
    test::writeFile(dir.file("video0_yuyv_libx264_20240101_120000.log"),
                    kHeader +
                    "1700000001,10,500,2.0\n"
                    "1700000002,20,700,4.0\n"
                    "1700000003,30,600,6.5\n");

    SummaryReport report = ResultSummarizer(dir.path().string()).summarize();
    ASSERT_EQ(report.log_count, 1u);
    ASSERT_EQ(report.entries.size(), 1u);

    const SummaryEntry& entry = report.entries[0];
    EXPECT_EQ(entry.test, "video0_yuyv_libx264_20240101_120000");
    EXPECT_DOUBLE_EQ(entry.avg_cpu_percent, 20.0);
    EXPECT_DOUBLE_EQ(entry.max_mem_mb, 700.0);
    EXPECT_DOUBLE_EQ(entry.avg_disk_kbps, 4.2);
    EXPECT_DOUBLE_EQ(entry.video_size_mb, 0.0);
    EXPECT_TRUE(entry.video_path.empty());
}

TEST(ResultSummarizer, SortedByAverageCpu) {
    test::TempDir dir;
    writeLog(dir, "a.log", {50.0, 50.0});
    writeLog(dir, "b.log", {10.0});
    writeLog(dir, "c.log", {25.0, 35.0});

    SummaryReport report = ResultSummarizer(dir.path().string()).summarize();
    ASSERT_EQ(report.entries.size(), 3u);
    EXPECT_EQ(report.entries[0].test, "b");
    EXPECT_EQ(report.entries[1].test, "c");
    EXPECT_EQ(report.entries[2].test, "a");
}

TEST(ResultSummarizer, MalformedLogIsExcluded) {
    test::TempDir dir;
    writeLog(dir, "good.log", {15.0});
    test::writeFile(dir.file("bad.log"), kHeader + "1700000001,busy,512,1.0\n");

    SummaryReport report = ResultSummarizer(dir.path().string()).summarize();
    EXPECT_EQ(report.log_count, 2u);
    ASSERT_EQ(report.entries.size(), 1u);
    EXPECT_EQ(report.entries[0].test, "good");

    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0].log_path, dir.file("bad.log"));
    EXPECT_EQ(report.errors[0].message,
              "line 2: non-numeric value 'busy' in column 'cpu_percent'");
}

TEST(ResultSummarizer, HeaderOnlyLogIsListedWithoutMetrics) {
    test::TempDir dir;
    writeLog(dir, "good.log", {15.0});
    test::writeFile(dir.file("aborted.log"), kHeader);
    test::writeFile(dir.file("aborted.mp4"), "");

    SummaryReport report = ResultSummarizer(dir.path().string()).summarize();
    EXPECT_TRUE(report.errors.empty());
    ASSERT_EQ(report.entries.size(), 2u);
    EXPECT_EQ(report.entries[0].test, "good");
    EXPECT_TRUE(report.entries[0].has_metrics);
    EXPECT_EQ(report.entries[1].test, "aborted");
    EXPECT_FALSE(report.entries[1].has_metrics);
    EXPECT_DOUBLE_EQ(report.entries[1].video_size_mb, 0.0);
    EXPECT_EQ(report.entries[1].video_path, dir.file("aborted.mp4"));
}

TEST(ResultSummarizer, ErrorLogsAreNotMetricsLogs) {
    test::TempDir dir;
    writeLog(dir, "video0_mjpeg_copy_20240101_120000.log", {5.0});
    test::writeFile(dir.file("video0_yuyv_copy_20240101_120001.mp4.error.log"),
                    "Invalid argument\n");
    test::writeFile(dir.file("notes.txt"), "x");

    auto logs = ResultSummarizer::findLogFiles(dir.path());
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].filename().string(), "video0_mjpeg_copy_20240101_120000.log");
}

TEST(ResultSummarizer, MediaSizeFromMatchingFile) {
    test::TempDir dir;
    writeLog(dir, "video0_mjpeg_copy_20240101_120000.log", {5.0});
    test::writeFile(dir.file("video0_mjpeg_copy_20240101_120000.avi"),
                    std::string(1024 * 1024 + 1024 * 512, 'x'));

    SummaryReport report = ResultSummarizer(dir.path().string()).summarize();
    ASSERT_EQ(report.entries.size(), 1u);
    EXPECT_DOUBLE_EQ(report.entries[0].video_size_mb, 1.5);
    EXPECT_EQ(report.entries[0].video_path, dir.file("video0_mjpeg_copy_20240101_120000.avi"));
}

TEST(ResultSummarizer, Mp4PreferredOverAvi) {
    test::TempDir dir;
    test::writeFile(dir.file("t.log"), kHeader);
    test::writeFile(dir.file("t.avi"), "avi");
    test::writeFile(dir.file("t.mp4"), "mp4");

    auto media = ResultSummarizer::findMediaFile(dir.path() / "t.log");
    ASSERT_TRUE(media.has_value());
    EXPECT_EQ(media->filename().string(), "t.mp4");

    EXPECT_FALSE(ResultSummarizer::findMediaFile(dir.path() / "other.log").has_value());
}

TEST(ResultSummarizer, ColumnWithoutValuesIsRejected) {
    MetricsLog log;
    MetricsSample sample;
    sample.cpu_percent = 10.0;
    sample.mem_used_mb = 100.0;
    log.samples.push_back(sample);

    std::string error;
    EXPECT_FALSE(ResultSummarizer::aggregate(log, error).has_value());
    EXPECT_EQ(error, "a metrics column holds no values");
}

TEST(ResultSummarizer, UnsetCellsAreIgnored) {
    MetricsLog log;
    MetricsSample first;
    first.cpu_percent = 10.0;
    first.mem_used_mb = 100.0;
    first.disk_write_kbps = 1.0;
    MetricsSample second;
    second.cpu_percent = 20.0;
    second.mem_used_mb = 300.0;
    log.samples = {first, second};

    std::string error;
    auto entry = ResultSummarizer::aggregate(log, error);
    ASSERT_TRUE(entry.has_value()) << error;
    EXPECT_DOUBLE_EQ(entry->avg_cpu_percent, 15.0);
    EXPECT_DOUBLE_EQ(entry->max_mem_mb, 300.0);
    EXPECT_DOUBLE_EQ(entry->avg_disk_kbps, 1.0);
}
