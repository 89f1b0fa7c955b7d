#include "monitor/metrics_sampler.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <cstdlib>

using namespace capture_bench;

namespace {

class FixedCpuMonitor : public CpuMonitor {
public:
    void startMeasurement() override { windows++; }
    double getCpuUsage() override { return 12.5; }
    int windows = 0;
};

class FixedMemoryMonitor : public MemoryMonitor {
public:
    size_t getUsedSystemMemoryMB() override { return 512; }
    size_t getTotalSystemMemoryMB() override { return 4096; }
};

class FixedDiskMonitor : public DiskMonitor {
public:
    void startMeasurement() override {}
    double getWriteRateKBps() override { return 3.0; }
};

std::unique_ptr<MetricsSampler> fixedSampler() {
    return std::make_unique<MetricsSampler>(std::make_unique<FixedCpuMonitor>(),
                                            std::make_unique<FixedMemoryMonitor>(),
                                            std::make_unique<FixedDiskMonitor>());
}

} // namespace

TEST(MetricsSampler, HeaderPlusOneRowPerSecond) {
    test::TempDir dir;
    SamplerOptions options;
    options.duration_seconds = 2;
    options.output_path = dir.file("job.log");

    std::string error;
    ASSERT_TRUE(fixedSampler()->run(options, error)) << error;

    auto lines = test::readLines(options.output_path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], kMetricsLogHeader);

    long long previous = 0;
    for (size_t i = 1; i < lines.size(); i++) {
        size_t comma = lines[i].find(',');
        ASSERT_NE(comma, std::string::npos);
        long long timestamp = std::atoll(lines[i].substr(0, comma).c_str());
        EXPECT_GE(timestamp, previous);
        previous = timestamp;
        EXPECT_EQ(lines[i].substr(comma), ",12.5,512,3.0");
    }
}

TEST(MetricsSampler, ZeroDurationWritesHeaderOnly) {
    test::TempDir dir;
    SamplerOptions options;
    options.duration_seconds = 0;
    options.output_path = dir.file("job.log");

    std::string error;
    ASSERT_TRUE(fixedSampler()->run(options, error)) << error;
    EXPECT_EQ(test::readLines(options.output_path),
              std::vector<std::string>{kMetricsLogHeader});
}

TEST(MetricsSampler, UnwritableOutput) {
    SamplerOptions options;
    options.duration_seconds = 1;
    options.output_path = "/nonexistent/dir/job.log";

    std::string error;
    EXPECT_FALSE(fixedSampler()->run(options, error));
    EXPECT_EQ(error, "Failed to open metrics log: /nonexistent/dir/job.log");
}

TEST(MetricsSampler, ProcBackedSamplerProducesRows) {
    test::TempDir dir;
    SamplerOptions options;
    options.duration_seconds = 1;
    options.output_path = dir.file("job.log");

    std::string error;
    ASSERT_TRUE(MetricsSampler::create()->run(options, error)) << error;
    EXPECT_EQ(test::readLines(options.output_path).size(), 2u);
}
