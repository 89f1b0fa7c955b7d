#include "matrix/job_scheduler.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace capture_bench;

namespace {

ConcurrencyPolicy policy(int max_jobs, bool exclusive) {
    ConcurrencyPolicy p;
    p.max_concurrent_jobs = max_jobs;
    p.exclusive_devices = exclusive;
    return p;
}

} // namespace

TEST(JobScheduler, CapsActiveJobs) {
    JobScheduler scheduler(policy(2, false));
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 6; i++) {
        threads.emplace_back([&, i] {
            JobScheduler::Slot slot(scheduler, "/dev/video" + std::to_string(i));
            int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            --active;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(scheduler.activeCount(), 0);
}

TEST(JobScheduler, ExclusiveDeviceBlocksSecondJob) {
    JobScheduler scheduler(policy(0, true));
    scheduler.acquire("/dev/video0");

    std::atomic<bool> started{false};
    std::thread second([&] {
        JobScheduler::Slot slot(scheduler, "/dev/video0");
        started = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(started.load());

    // Another device is not held up
    scheduler.acquire("/dev/video1");
    EXPECT_EQ(scheduler.activeCount(), 2);
    scheduler.release("/dev/video1");

    scheduler.release("/dev/video0");
    second.join();
    EXPECT_TRUE(started.load());
    EXPECT_EQ(scheduler.activeCount(), 0);
}

TEST(JobScheduler, SharedDevicesMayOverlap) {
    JobScheduler scheduler(policy(0, false));
    scheduler.acquire("/dev/video0");
    scheduler.acquire("/dev/video0");
    EXPECT_EQ(scheduler.activeCount(), 2);
    scheduler.release("/dev/video0");
    scheduler.release("/dev/video0");
    EXPECT_EQ(scheduler.activeCount(), 0);
}
