#ifndef CAPTURE_JOB_HPP
#define CAPTURE_JOB_HPP

#include "matrix/capture_config.hpp"
#include "device/device_enumerator.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace capture_bench {

enum class JobState {
    Pending,
    Running,
    Succeeded,
    Failed,
    Skipped
};

std::string jobStateName(JobState state);

// One device x format x encoder combination
struct CaptureJob {
    std::string device_path;
    std::string device_name;   // basename of the device node
    PixelFormat format;
    Encoder encoder;
    Container container;
    std::string timestamp;     // YYYYmmdd_HHMMSS
    int duration_seconds;

    // "<device>_<format>_<encoder>_<timestamp>"
    std::string namePrefix() const;

    std::string outputPath(const std::string& output_dir) const;
    std::string logPath(const std::string& output_dir) const;
    std::string errorLogPath(const std::string& output_dir) const;

    // "yuyv -> libx264 (mp4)"
    std::string describe() const;

    static CaptureJob create(const CaptureDevice& device, PixelFormat format,
                             Encoder encoder, const CaptureConfig& config,
                             std::chrono::system_clock::time_point now);

    static std::string formatTimestamp(std::chrono::system_clock::time_point time);
};

// Full ffmpeg command line for a capture job
std::vector<std::string> buildCaptureCommand(const CaptureJob& job,
                                             const CaptureConfig& config);

} // namespace capture_bench

#endif // CAPTURE_JOB_HPP
