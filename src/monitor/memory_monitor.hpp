#ifndef MEMORY_MONITOR_HPP
#define MEMORY_MONITOR_HPP

#include <memory>
#include <cstddef>

namespace capture_bench {

// System memory figures; every getter returns 0 when /proc is unreadable
class MemoryMonitor {
public:
    virtual ~MemoryMonitor() = default;

    static std::unique_ptr<MemoryMonitor> create();

    // Memory in use system-wide, in MB (as reported by free -m)
    virtual size_t getUsedSystemMemoryMB() = 0;

    // Total physical system memory in MB
    virtual size_t getTotalSystemMemoryMB() = 0;

protected:
    MemoryMonitor() = default;
};

} // namespace capture_bench

#endif // MEMORY_MONITOR_HPP
