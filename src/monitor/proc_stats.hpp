#ifndef PROC_STATS_HPP
#define PROC_STATS_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <string>

namespace capture_bench {

// Aggregate "cpu" line of /proc/stat, in clock ticks
struct CpuTimes {
    uint64_t user;
    uint64_t nice;
    uint64_t system;
    uint64_t idle;
    uint64_t iowait;
    uint64_t irq;
    uint64_t softirq;
    uint64_t steal;

    uint64_t totalActive() const {
        return user + nice + system + irq + softirq + steal;
    }

    uint64_t totalIdle() const {
        return idle + iowait;
    }

    uint64_t total() const {
        return totalActive() + totalIdle();
    }
};

// Busy percentage between two /proc/stat snapshots (0 if no time passed)
double cpuUsageBetween(const CpuTimes& start, const CpuTimes& end);

std::optional<CpuTimes> parseProcStat(std::istream& in);

// Fields of /proc/meminfo, in kB
struct MemInfo {
    size_t total_kb = 0;
    size_t free_kb = 0;
    size_t available_kb = 0;
    size_t buffers_kb = 0;
    size_t cached_kb = 0;
    bool has_available = false;

    // Same figure as the "used" column of free(1)
    size_t usedMB() const;
};

std::optional<MemInfo> parseMeminfo(std::istream& in);

// Sum of sectors written (field 10 of /proc/diskstats) over the devices
// accepted by include_device
uint64_t parseDiskstatsSectorsWritten(std::istream& in,
                                      const std::function<bool(const std::string&)>& include_device);

// Whole block devices only: partitions, loop, ram and zram devices are
// left out so writes are not counted twice
bool isPhysicalDisk(const std::string& name, const std::string& sys_block_dir = "/sys/block");

} // namespace capture_bench

#endif // PROC_STATS_HPP
