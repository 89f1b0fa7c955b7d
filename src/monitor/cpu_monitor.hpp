#ifndef CPU_MONITOR_HPP
#define CPU_MONITOR_HPP

#include <memory>

namespace capture_bench {

// System-wide CPU usage over a measurement window
class CpuMonitor {
public:
    virtual ~CpuMonitor() = default;

    static std::unique_ptr<CpuMonitor> create();

    // Start a new measurement window
    virtual void startMeasurement() = 0;

    // Busy percentage (0.0 - 100.0) across all cores since startMeasurement().
    // 0.0 when the counters cannot be read.
    virtual double getCpuUsage() = 0;

protected:
    CpuMonitor() = default;
};

} // namespace capture_bench

#endif // CPU_MONITOR_HPP
