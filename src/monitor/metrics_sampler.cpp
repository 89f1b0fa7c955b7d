#include "monitor/metrics_sampler.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <thread>

namespace capture_bench {

namespace {
constexpr std::chrono::seconds kSampleInterval(1);
} // namespace

MetricsSampler::MetricsSampler(std::unique_ptr<CpuMonitor> cpu_monitor,
                               std::unique_ptr<MemoryMonitor> memory_monitor,
                               std::unique_ptr<DiskMonitor> disk_monitor)
    : cpu_monitor_(std::move(cpu_monitor)),
      memory_monitor_(std::move(memory_monitor)),
      disk_monitor_(std::move(disk_monitor)) {
}

std::unique_ptr<MetricsSampler> MetricsSampler::create() {
    return std::make_unique<MetricsSampler>(
        CpuMonitor::create(), MemoryMonitor::create(), DiskMonitor::create());
}

bool MetricsSampler::run(const SamplerOptions& options, std::string& error_message) {
    std::ofstream file(options.output_path, std::ios::trunc);
    if (!file.is_open()) {
        error_message = "Failed to open metrics log: " + options.output_path;
        return false;
    }

    file << kMetricsLogHeader << "\n" << std::flush;
    file << std::fixed;

    const auto start = std::chrono::steady_clock::now();
    int64_t last_timestamp = 0;

    cpu_monitor_->startMeasurement();
    disk_monitor_->startMeasurement();

    for (int i = 1; i <= options.duration_seconds; i++) {
        std::this_thread::sleep_until(start + i * kSampleInterval);

        double cpu = cpu_monitor_->getCpuUsage();
        double disk = disk_monitor_->getWriteRateKBps();
        size_t mem = memory_monitor_->getUsedSystemMemoryMB();

        cpu_monitor_->startMeasurement();
        disk_monitor_->startMeasurement();

        // Wall clock may step backwards; rows must not
        int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        last_timestamp = std::max(last_timestamp, now);

        file << last_timestamp << ","
             << std::setprecision(1) << cpu << ","
             << mem << ","
             << std::setprecision(1) << disk << "\n"
             << std::flush;

        if (!file.good()) {
            error_message = "Failed to write metrics log: " + options.output_path;
            return false;
        }
    }

    return true;
}

} // namespace capture_bench
