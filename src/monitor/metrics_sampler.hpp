#ifndef METRICS_SAMPLER_HPP
#define METRICS_SAMPLER_HPP

#include "monitor/cpu_monitor.hpp"
#include "monitor/disk_monitor.hpp"
#include "monitor/memory_monitor.hpp"
#include <memory>
#include <string>

namespace capture_bench {

// Header row of every per-job metrics log
constexpr const char* kMetricsLogHeader = "timestamp,cpu_percent,mem_used_mb,disk_write_kbps";

struct SamplerOptions {
    int duration_seconds = 0;
    std::string output_path;
};

// Writes one CSV row per elapsed second for a fixed duration.
//
// The loop has no cancellation of its own; the matrix runner runs it in a
// separate process and terminates that process when the capture ends.
class MetricsSampler {
public:
    MetricsSampler(std::unique_ptr<CpuMonitor> cpu_monitor,
                   std::unique_ptr<MemoryMonitor> memory_monitor,
                   std::unique_ptr<DiskMonitor> disk_monitor);

    // Sampler backed by /proc
    static std::unique_ptr<MetricsSampler> create();

    // Header plus duration_seconds rows. Fails only if the output file
    // cannot be written; unreadable metrics are recorded as 0.
    bool run(const SamplerOptions& options, std::string& error_message);

private:
    std::unique_ptr<CpuMonitor> cpu_monitor_;
    std::unique_ptr<MemoryMonitor> memory_monitor_;
    std::unique_ptr<DiskMonitor> disk_monitor_;
};

} // namespace capture_bench

#endif // METRICS_SAMPLER_HPP
