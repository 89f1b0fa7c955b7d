#include "monitor/proc_stats.hpp"
#include <filesystem>
#include <sstream>

namespace capture_bench {

namespace {

// Value of a "Key:   1234 kB" line
bool readMeminfoValue(const std::string& line, const char* key, size_t& value) {
    const size_t key_len = std::char_traits<char>::length(key);
    if (line.compare(0, key_len, key) != 0) {
        return false;
    }
    std::istringstream iss(line.substr(key_len));
    size_t kb = 0;
    if (iss >> kb) {
        value = kb;
        return true;
    }
    return false;
}

} // namespace

double cpuUsageBetween(const CpuTimes& start, const CpuTimes& end) {
    if (end.total() <= start.total()) {
        return 0.0;
    }

    uint64_t total_diff = end.total() - start.total();
    uint64_t idle_diff = end.totalIdle() >= start.totalIdle()
                             ? end.totalIdle() - start.totalIdle()
                             : 0;
    if (idle_diff > total_diff) {
        return 0.0;
    }

    return 100.0 * (1.0 - static_cast<double>(idle_diff) /
                              static_cast<double>(total_diff));
}

std::optional<CpuTimes> parseProcStat(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string label;
        iss >> label;
        if (label != "cpu") {
            continue;
        }

        CpuTimes times{};
        iss >> times.user >> times.nice >> times.system >> times.idle;
        if (!iss) {
            return std::nullopt;
        }
        // Older kernels stop after idle
        iss >> times.iowait >> times.irq >> times.softirq >> times.steal;
        return times;
    }
    return std::nullopt;
}

size_t MemInfo::usedMB() const {
    size_t unused;
    if (has_available) {
        unused = available_kb;
    } else {
        unused = free_kb + buffers_kb + cached_kb;
    }
    return unused >= total_kb ? 0 : (total_kb - unused) / 1024;
}

std::optional<MemInfo> parseMeminfo(std::istream& in) {
    MemInfo info;
    bool has_total = false;

    std::string line;
    while (std::getline(in, line)) {
        if (readMeminfoValue(line, "MemTotal:", info.total_kb)) {
            has_total = true;
        } else if (readMeminfoValue(line, "MemAvailable:", info.available_kb)) {
            info.has_available = true;
        } else {
            readMeminfoValue(line, "MemFree:", info.free_kb) ||
                readMeminfoValue(line, "Buffers:", info.buffers_kb) ||
                readMeminfoValue(line, "Cached:", info.cached_kb);
        }
    }

    if (!has_total) {
        return std::nullopt;
    }
    return info;
}

uint64_t parseDiskstatsSectorsWritten(std::istream& in,
                                      const std::function<bool(const std::string&)>& include_device) {
    uint64_t total = 0;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        unsigned int major = 0;
        unsigned int minor = 0;
        std::string name;
        uint64_t reads = 0, reads_merged = 0, sectors_read = 0, read_ms = 0;
        uint64_t writes = 0, writes_merged = 0, sectors_written = 0;

        if (!(iss >> major >> minor >> name >> reads >> reads_merged >> sectors_read >>
              read_ms >> writes >> writes_merged >> sectors_written)) {
            continue;
        }
        if (include_device && !include_device(name)) {
            continue;
        }
        total += sectors_written;
    }

    return total;
}

bool isPhysicalDisk(const std::string& name, const std::string& sys_block_dir) {
    if (name.rfind("loop", 0) == 0 || name.rfind("ram", 0) == 0 ||
        name.rfind("zram", 0) == 0) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(sys_block_dir) / name, ec);
}

} // namespace capture_bench
