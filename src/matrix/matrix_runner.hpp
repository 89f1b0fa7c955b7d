#ifndef MATRIX_RUNNER_HPP
#define MATRIX_RUNNER_HPP

#include "matrix/capture_config.hpp"
#include "matrix/job_result.hpp"
#include "device/device_enumerator.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace capture_bench {

// A combination selected for the run, before it is launched
struct PlannedJob {
    CaptureDevice device;
    PixelFormat format;
    Encoder encoder;
    bool skipped = false;
    std::string skip_reason;
};

// An advertised format that produces no jobs
struct FormatNote {
    std::string device_path;
    std::string fourcc;
    std::string reason;
};

struct MatrixPlan {
    std::vector<PlannedJob> jobs;
    std::vector<FormatNote> notes;
};

// Progress hooks; every callback is optional and invoked one at a time
struct RunObserver {
    // probe_ok is empty when connectivity probing is disabled
    std::function<void(const CaptureDevice&, std::optional<bool> probe_ok)> on_device;
    std::function<void(const FormatNote&)> on_format_note;
    std::function<void(const CaptureJob&, int index)> on_job_start;
    // tally holds the counters so far; its outcomes are filled only at the end
    std::function<void(const JobOutcome&, const RunSummary& tally)> on_job_finished;
};

class MatrixRunner {
public:
    explicit MatrixRunner(const CaptureConfig& config);

    // Programs that must be available before any job runs
    static std::vector<std::string> missingDependencies(const CaptureConfig& config);

    // Cartesian product of devices, configured formats the device advertises
    // and encoders, plus a note for every format left out
    MatrixPlan plan(const std::vector<CaptureDevice>& devices) const;

    // Run every planned job under the configured concurrency policy and
    // block until all of them have finished
    RunSummary run(const std::vector<CaptureDevice>& devices,
                   const RunObserver& observer = RunObserver());

    // Capture and sample one job; the sampler is stopped on every path
    JobOutcome runJob(const CaptureJob& job, int index);

    // Try to read a single frame from the device
    bool probeDevice(const CaptureDevice& device) const;

private:
    JobOutcome skippedOutcome(const PlannedJob& planned) const;

    void runSequential(const MatrixPlan& plan, const RunObserver& observer,
                       std::vector<JobOutcome>& outcomes, RunSummary& summary);
    void runParallel(const MatrixPlan& plan, const RunObserver& observer,
                     std::vector<JobOutcome>& outcomes, RunSummary& summary);

    // Updates the tally and notifies the observer under report_mutex_
    void recordOutcome(const JobOutcome& outcome, const RunObserver& observer,
                       RunSummary& summary);

    std::string samplerExecutable() const;

    CaptureConfig config_;
    std::mutex report_mutex_;
};

} // namespace capture_bench

#endif // MATRIX_RUNNER_HPP
