#include "monitor/memory_monitor.hpp"
#include "monitor/proc_stats.hpp"
#include <fstream>
#include <optional>

namespace capture_bench {

class LinuxMemoryMonitor : public MemoryMonitor {
public:
    LinuxMemoryMonitor() = default;

    size_t getUsedSystemMemoryMB() override {
        auto info = readMeminfo();
        return info ? info->usedMB() : 0;
    }

    size_t getTotalSystemMemoryMB() override {
        auto info = readMeminfo();
        return info ? info->total_kb / 1024 : 0;
    }

private:
    std::optional<MemInfo> readMeminfo() {
        std::ifstream meminfo("/proc/meminfo");
        if (!meminfo.is_open()) {
            return std::nullopt;
        }
        return parseMeminfo(meminfo);
    }
};

std::unique_ptr<MemoryMonitor> MemoryMonitor::create() {
    return std::make_unique<LinuxMemoryMonitor>();
}

} // namespace capture_bench
