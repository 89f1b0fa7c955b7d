#include "matrix/job_scheduler.hpp"

namespace capture_bench {

JobScheduler::JobScheduler(const ConcurrencyPolicy& policy)
    : max_active_(policy.max_concurrent_jobs < 0 ? 0 : policy.max_concurrent_jobs),
      exclusive_devices_(policy.exclusive_devices) {
}

bool JobScheduler::canStart(const std::string& device_path) const {
    if (max_active_ > 0 && active_ >= max_active_) {
        return false;
    }
    if (exclusive_devices_ && busy_devices_.count(device_path) > 0) {
        return false;
    }
    return true;
}

void JobScheduler::acquire(const std::string& device_path) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return canStart(device_path); });
    active_++;
    busy_devices_.insert(device_path);
}

void JobScheduler::release(const std::string& device_path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_--;
        auto it = busy_devices_.find(device_path);
        if (it != busy_devices_.end()) {
            busy_devices_.erase(it);
        }
    }
    cv_.notify_all();
}

int JobScheduler::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

JobScheduler::Slot::Slot(JobScheduler& scheduler, std::string device_path)
    : scheduler_(scheduler), device_path_(std::move(device_path)) {
    scheduler_.acquire(device_path_);
}

JobScheduler::Slot::~Slot() {
    scheduler_.release(device_path_);
}

} // namespace capture_bench
