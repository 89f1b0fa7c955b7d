#include "matrix/matrix_runner.hpp"
#include "matrix/job_scheduler.hpp"
#include "utils/logger.hpp"
#include "capture_bench/version.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <thread>

namespace capture_bench {

namespace {
// Single-frame connectivity probe bound
constexpr std::chrono::seconds kProbeTimeout(5);
// Error log lines echoed to the console for a failed job
constexpr size_t kErrorPreviewLines = 3;
// Used when no sampler executable is configured
constexpr const char* kSelfExecutable = "/proc/self/exe";

std::vector<std::string> readFirstLines(const std::string& path, size_t count) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (lines.size() < count && std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

void appendLine(const std::string& path, const std::string& line) {
    std::ofstream file(path, std::ios::app);
    if (!file.is_open()) {
        Logger::error("Cannot append to error log: " + path);
        return;
    }
    file << line << "\n";
}

} // namespace

MatrixRunner::MatrixRunner(const CaptureConfig& config)
    : config_(config) {
}

std::vector<std::string> MatrixRunner::missingDependencies(const CaptureConfig& config) {
    std::vector<std::string> missing;
    if (!Subprocess::findExecutable(config.ffmpeg_path)) {
        missing.push_back(config.ffmpeg_path);
    }
    return missing;
}

std::string MatrixRunner::samplerExecutable() const {
    return config_.sampler_executable.empty() ? kSelfExecutable
                                              : config_.sampler_executable;
}

MatrixPlan MatrixRunner::plan(const std::vector<CaptureDevice>& devices) const {
    MatrixPlan result;

    for (const auto& device : devices) {
        for (PixelFormat format : config_.formats) {
            const std::string fourcc = pixelFormatFourcc(format);
            if (!device.supportsFourcc(fourcc)) {
                result.notes.push_back({device.path, fourcc, "unsupported test format"});
                continue;
            }

            for (Encoder encoder : config_.encoders) {
                PlannedJob planned;
                planned.device = device;
                planned.format = format;
                planned.encoder = encoder;
                if (!isCompatible(format, encoder)) {
                    planned.skipped = true;
                    planned.skip_reason = "raw " + pixelFormatName(format) + " cannot be copied into " +
                                          containerExtension(containerForFormat(format));
                }
                result.jobs.push_back(std::move(planned));
            }
        }

        // Advertised formats that produce no jobs
        for (const auto& fourcc : device.fourccs) {
            auto format = pixelFormatFromFourcc(fourcc);
            if (!format) {
                result.notes.push_back({device.path, fourcc, "no test profile for this format"});
            } else if (std::find(config_.formats.begin(), config_.formats.end(), *format) ==
                       config_.formats.end()) {
                result.notes.push_back({device.path, fourcc, "format not selected"});
            }
        }
    }

    return result;
}

bool MatrixRunner::probeDevice(const CaptureDevice& device) const {
    std::string error;
    auto probe = Subprocess::spawn(
        {config_.ffmpeg_path, "-f", "v4l2", "-i", device.path, "-frames:v", "1", "-f", "null", "-"},
        ProcessOptions(), error);
    if (!probe) {
        Logger::warn("Connectivity probe of " + device.path + " not started: " + error);
        return false;
    }

    ExitStatus status = probe->waitFor(kProbeTimeout);
    if (!status.success()) {
        Logger::warn("Connectivity probe of " + device.path + " failed: " + status.describe());
    }
    return status.success();
}

JobOutcome MatrixRunner::skippedOutcome(const PlannedJob& planned) const {
    JobOutcome outcome;
    outcome.job = CaptureJob::create(planned.device, planned.format, planned.encoder,
                                     config_, std::chrono::system_clock::now());
    // Never launched, so it owns no files and carries no timestamp
    outcome.job.timestamp.clear();
    outcome.state = JobState::Skipped;
    outcome.skip_reason = planned.skip_reason;
    return outcome;
}

JobOutcome MatrixRunner::runJob(const CaptureJob& job, int index) {
    JobOutcome outcome;
    outcome.job = job;
    outcome.index = index;
    outcome.state = JobState::Running;
    outcome.output_path = job.outputPath(config_.output_dir);
    outcome.log_path = job.logPath(config_.output_dir);
    outcome.error_log_path = job.errorLogPath(config_.output_dir);

    const auto duration = std::chrono::seconds(job.duration_seconds);
    const auto capture_budget = duration + std::chrono::seconds(config_.grace_period_seconds);

    Logger::info("Job " + job.namePrefix() + " starting on " + job.device_path);

    std::string error;
    auto sampler = Subprocess::spawn(
        {samplerExecutable(), "sample",
         "--duration", std::to_string(job.duration_seconds),
         "--output", outcome.log_path},
        ProcessOptions(), error);
    if (!sampler) {
        Logger::warn("Metrics sampler not started for " + job.namePrefix() + ": " + error);
    }

    ProcessOptions capture_options;
    capture_options.stderr_path = outcome.error_log_path;

    auto capture = Subprocess::spawn(buildCaptureCommand(job, config_), capture_options, error);
    if (!capture) {
        outcome.failure_reason = error;
    } else {
        outcome.capture_status =
            capture->waitFor(std::chrono::duration_cast<std::chrono::milliseconds>(capture_budget));
        if (outcome.capture_status.timed_out) {
            outcome.failure_reason = "capture timed out after " +
                                     std::to_string(capture_budget.count()) + "s";
        } else if (!outcome.capture_status.success()) {
            outcome.failure_reason = "ffmpeg " + outcome.capture_status.describe();
        }
    }

    if (sampler) {
        ExitStatus sampler_status = sampler->terminate();
        if (sampler_status.exited && sampler_status.exit_code != 0) {
            Logger::warn("Metrics sampler for " + job.namePrefix() + " ended with " +
                         sampler_status.describe());
        }
    }

    std::error_code ec;
    if (outcome.failure_reason.empty() && !std::filesystem::exists(outcome.output_path, ec)) {
        outcome.failure_reason = "ffmpeg exited cleanly but produced no output file";
    }

    if (!outcome.failure_reason.empty()) {
        outcome.state = JobState::Failed;
        appendLine(outcome.error_log_path, "[" + std::string(PROGRAM_NAME) + "] " +
                                               outcome.failure_reason);
        outcome.error_preview = readFirstLines(outcome.error_log_path, kErrorPreviewLines);
        Logger::error("Job " + job.namePrefix() + " failed: " + outcome.failure_reason +
                      " (see " + outcome.error_log_path + ")");
        return outcome;
    }

    outcome.state = JobState::Succeeded;
    std::filesystem::remove(outcome.error_log_path, ec);
    outcome.error_log_path.clear();

    outcome.output_size_bytes = std::filesystem::file_size(outcome.output_path, ec);
    if (ec) {
        outcome.output_size_bytes = 0;
    }

    std::string probe_error;
    outcome.media = MediaProbe::probe(outcome.output_path, probe_error);
    if (!outcome.media) {
        Logger::warn("Cannot inspect " + outcome.output_path + ": " + probe_error);
    } else {
        Logger::info("Probed " + outcome.output_path + ": " + outcome.media->container_name +
                     ", " + outcome.media->codec_name + " " +
                     std::to_string(outcome.media->width) + "x" +
                     std::to_string(outcome.media->height) + ", " +
                     std::to_string(outcome.media->total_frames) + " frames");
    }

    Logger::info("Job " + job.namePrefix() + " succeeded (" +
                 std::to_string(outcome.output_size_bytes) + " bytes)");
    return outcome;
}

void MatrixRunner::recordOutcome(const JobOutcome& outcome, const RunObserver& observer,
                                 RunSummary& summary) {
    std::lock_guard<std::mutex> lock(report_mutex_);
    Logger::info(outcome.job.device_name + " " + outcome.job.describe() + ": " +
                 jobStateName(outcome.state));
    switch (outcome.state) {
        case JobState::Succeeded:
            summary.succeeded++;
            break;
        case JobState::Failed:
            summary.failed++;
            break;
        case JobState::Skipped:
            summary.skipped++;
            break;
        default:
            break;
    }
    if (observer.on_job_finished) {
        observer.on_job_finished(outcome, summary);
    }
}

void MatrixRunner::runSequential(const MatrixPlan& plan, const RunObserver& observer,
                                 std::vector<JobOutcome>& outcomes, RunSummary& summary) {
    bool first = true;

    for (size_t i = 0; i < plan.jobs.size(); i++) {
        const PlannedJob& planned = plan.jobs[i];

        if (planned.skipped) {
            outcomes[i] = skippedOutcome(planned);
            recordOutcome(outcomes[i], observer, summary);
            continue;
        }

        if (!first && config_.policy.inter_job_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.policy.inter_job_delay_ms));
        }
        first = false;

        int index = ++summary.attempted;
        CaptureJob job = CaptureJob::create(planned.device, planned.format, planned.encoder,
                                            config_, std::chrono::system_clock::now());
        if (observer.on_job_start) {
            std::lock_guard<std::mutex> lock(report_mutex_);
            observer.on_job_start(job, index);
        }

        outcomes[i] = runJob(job, index);
        recordOutcome(outcomes[i], observer, summary);
    }
}

void MatrixRunner::runParallel(const MatrixPlan& plan, const RunObserver& observer,
                               std::vector<JobOutcome>& outcomes, RunSummary& summary) {
    JobScheduler scheduler(config_.policy);
    std::vector<std::thread> workers;
    workers.reserve(plan.jobs.size());

    for (size_t i = 0; i < plan.jobs.size(); i++) {
        const PlannedJob& planned = plan.jobs[i];

        if (planned.skipped) {
            outcomes[i] = skippedOutcome(planned);
            recordOutcome(outcomes[i], observer, summary);
            continue;
        }

        if (!workers.empty() && config_.policy.stagger_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.policy.stagger_ms));
        }

        // Each worker writes only its own element of outcomes
        workers.emplace_back([this, &scheduler, &planned, &observer, &outcomes, &summary, i] {
            JobScheduler::Slot slot(scheduler, planned.device.path);

            // Jobs are numbered and counted in admission order
            CaptureJob job = CaptureJob::create(planned.device, planned.format, planned.encoder,
                                                config_, std::chrono::system_clock::now());
            int index;
            {
                std::lock_guard<std::mutex> lock(report_mutex_);
                index = ++summary.attempted;
                Logger::info("Job " + std::to_string(index) + " admitted on " + planned.device.path +
                             " (" + std::to_string(scheduler.activeCount()) + " active)");
                if (observer.on_job_start) {
                    observer.on_job_start(job, index);
                }
            }

            outcomes[i] = runJob(job, index);
            recordOutcome(outcomes[i], observer, summary);
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }
}

RunSummary MatrixRunner::run(const std::vector<CaptureDevice>& devices,
                             const RunObserver& observer) {
    RunSummary summary;

    std::error_code ec;
    std::filesystem::create_directories(config_.output_dir, ec);
    if (ec) {
        Logger::error("Cannot create output directory " + config_.output_dir + ": " + ec.message());
    }

    MatrixPlan matrix = plan(devices);

    for (const auto& device : devices) {
        std::optional<bool> probe_ok;
        if (config_.probe_connectivity) {
            probe_ok = probeDevice(device);
        }
        if (observer.on_device) {
            observer.on_device(device, probe_ok);
        }
        for (const auto& note : matrix.notes) {
            if (note.device_path == device.path && observer.on_format_note) {
                observer.on_format_note(note);
            }
        }
    }

    std::vector<JobOutcome> outcomes(matrix.jobs.size());

    if (config_.policy.isSequential()) {
        runSequential(matrix, observer, outcomes, summary);
    } else {
        runParallel(matrix, observer, outcomes, summary);
    }

    summary.outcomes = std::move(outcomes);

    Logger::info("Run finished: " + std::to_string(summary.attempted) + " attempted, " +
                 std::to_string(summary.succeeded) + " succeeded, " +
                 std::to_string(summary.failed) + " failed, " +
                 std::to_string(summary.skipped) + " skipped");
    return summary;
}

} // namespace capture_bench
