#include "matrix/capture_job.hpp"
#include <ctime>
#include <filesystem>

namespace capture_bench {

std::string jobStateName(JobState state) {
    switch (state) {
        case JobState::Pending:
            return "PENDING";
        case JobState::Running:
            return "RUNNING";
        case JobState::Succeeded:
            return "SUCCEEDED";
        case JobState::Failed:
            return "FAILED";
        case JobState::Skipped:
            return "SKIPPED";
    }
    return "UNKNOWN";
}

std::string CaptureJob::namePrefix() const {
    return device_name + "_" + pixelFormatName(format) + "_" + encoderName(encoder) +
           "_" + timestamp;
}

std::string CaptureJob::outputPath(const std::string& output_dir) const {
    return (std::filesystem::path(output_dir) /
            (namePrefix() + "." + containerExtension(container))).string();
}

std::string CaptureJob::logPath(const std::string& output_dir) const {
    return (std::filesystem::path(output_dir) / (namePrefix() + ".log")).string();
}

std::string CaptureJob::errorLogPath(const std::string& output_dir) const {
    return outputPath(output_dir) + ".error.log";
}

std::string CaptureJob::describe() const {
    return pixelFormatName(format) + " -> " + encoderName(encoder) + " (" +
           containerExtension(container) + ")";
}

CaptureJob CaptureJob::create(const CaptureDevice& device, PixelFormat format,
                              Encoder encoder, const CaptureConfig& config,
                              std::chrono::system_clock::time_point now) {
    CaptureJob job;
    job.device_path = device.path;
    job.device_name = device.basename();
    job.format = format;
    job.encoder = encoder;
    job.container = containerForFormat(format);
    job.timestamp = formatTimestamp(now);
    job.duration_seconds = config.duration_seconds;
    return job;
}

std::string CaptureJob::formatTimestamp(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local);
    return buffer;
}

std::vector<std::string> buildCaptureCommand(const CaptureJob& job,
                                             const CaptureConfig& config) {
    std::vector<std::string> command = {
        config.ffmpeg_path,
        "-y",
        "-f", "v4l2",
        "-framerate", std::to_string(config.fps),
        "-video_size", config.getResolutionString(),
        "-input_format", pixelFormatInputName(job.format),
        "-i", job.device_path,
    };

    for (auto& arg : encoderArguments(job.encoder)) {
        command.push_back(std::move(arg));
    }

    command.push_back("-t");
    command.push_back(std::to_string(job.duration_seconds));
    command.push_back(job.outputPath(config.output_dir));
    return command;
}

} // namespace capture_bench
