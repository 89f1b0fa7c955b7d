#include "monitor/disk_monitor.hpp"
#include "monitor/proc_stats.hpp"
#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>

namespace capture_bench {

namespace {
// /proc/diskstats counts 512-byte sectors regardless of the device
constexpr double kSectorSizeBytes = 512.0;
} // namespace

class LinuxDiskMonitor : public DiskMonitor {
public:
    LinuxDiskMonitor() = default;

    void startMeasurement() override {
        start_sectors_ = readSectorsWritten();
        start_time_ = std::chrono::steady_clock::now();
    }

    double getWriteRateKBps() override {
        auto current = readSectorsWritten();
        double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time_).count();

        if (!start_sectors_ || !current || *current < *start_sectors_ || elapsed <= 0.0) {
            return 0.0;
        }

        double kb = static_cast<double>(*current - *start_sectors_) * kSectorSizeBytes / 1024.0;
        return kb / elapsed;
    }

private:
    std::optional<uint64_t> readSectorsWritten() {
        std::ifstream diskstats("/proc/diskstats");
        if (!diskstats.is_open()) {
            return std::nullopt;
        }
        return parseDiskstatsSectorsWritten(diskstats, [](const std::string& name) {
            return isPhysicalDisk(name);
        });
    }

    std::optional<uint64_t> start_sectors_;
    std::chrono::steady_clock::time_point start_time_{};
};

std::unique_ptr<DiskMonitor> DiskMonitor::create() {
    return std::make_unique<LinuxDiskMonitor>();
}

} // namespace capture_bench
