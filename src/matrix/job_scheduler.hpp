#ifndef JOB_SCHEDULER_HPP
#define JOB_SCHEDULER_HPP

#include "matrix/capture_config.hpp"
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>

namespace capture_bench {

// Admission control for concurrently running jobs: caps the number of
// active jobs and, when exclusive, keeps one job per device at a time.
class JobScheduler {
public:
    explicit JobScheduler(const ConcurrencyPolicy& policy);

    // Blocks until a job on this device may start
    void acquire(const std::string& device_path);
    void release(const std::string& device_path);

    int activeCount() const;

    // Holds an admission for its lifetime
    class Slot {
    public:
        Slot(JobScheduler& scheduler, std::string device_path);
        ~Slot();

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        JobScheduler& scheduler_;
        std::string device_path_;
    };

private:
    bool canStart(const std::string& device_path) const;

    int max_active_;   // 0 = unlimited
    bool exclusive_devices_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int active_ = 0;
    std::multiset<std::string> busy_devices_;
};

} // namespace capture_bench

#endif // JOB_SCHEDULER_HPP
