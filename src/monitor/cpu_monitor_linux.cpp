#include "monitor/cpu_monitor.hpp"
#include "monitor/proc_stats.hpp"
#include <fstream>
#include <optional>

namespace capture_bench {

class LinuxCpuMonitor : public CpuMonitor {
public:
    LinuxCpuMonitor() = default;

    void startMeasurement() override {
        start_times_ = readCpuTimes();
    }

    double getCpuUsage() override {
        auto current = readCpuTimes();
        if (!start_times_ || !current) {
            return 0.0;
        }
        return cpuUsageBetween(*start_times_, *current);
    }

private:
    std::optional<CpuTimes> readCpuTimes() {
        std::ifstream proc_stat("/proc/stat");
        if (!proc_stat.is_open()) {
            return std::nullopt;
        }
        return parseProcStat(proc_stat);
    }

    std::optional<CpuTimes> start_times_;
};

std::unique_ptr<CpuMonitor> CpuMonitor::create() {
    return std::make_unique<LinuxCpuMonitor>();
}

} // namespace capture_bench
