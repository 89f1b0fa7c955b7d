#ifndef DISK_MONITOR_HPP
#define DISK_MONITOR_HPP

#include <memory>

namespace capture_bench {

// Disk write throughput of all physical disks over a measurement window
class DiskMonitor {
public:
    virtual ~DiskMonitor() = default;

    static std::unique_ptr<DiskMonitor> create();

    // Start a new measurement window
    virtual void startMeasurement() = 0;

    // KB written per second since startMeasurement(), 0.0 if unknown
    virtual double getWriteRateKBps() = 0;

protected:
    DiskMonitor() = default;
};

} // namespace capture_bench

#endif // DISK_MONITOR_HPP
