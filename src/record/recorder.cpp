#include "record/recorder.hpp"
#include "matrix/capture_job.hpp"
#include "process/subprocess.hpp"
#include "utils/logger.hpp"
#include <signal.h>
#include <charconv>
#include <filesystem>
#include <utility>

namespace capture_bench {

namespace {

// Extra time on top of a fixed duration before ffmpeg is killed
constexpr std::chrono::seconds kGracePeriod(10);

// Ignores SIGINT for its lifetime so that only the foreground ffmpeg
// reacts to Ctrl-C
class IgnoreInterrupts {
public:
    IgnoreInterrupts() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        installed_ = ::sigaction(SIGINT, &ignore, &previous_) == 0;
    }

    ~IgnoreInterrupts() {
        if (installed_) {
            ::sigaction(SIGINT, &previous_, nullptr);
        }
    }

    IgnoreInterrupts(const IgnoreInterrupts&) = delete;
    IgnoreInterrupts& operator=(const IgnoreInterrupts&) = delete;

private:
    struct sigaction previous_ {};
    bool installed_ = false;
};

std::string trim(const std::string& str) {
    size_t begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
}

} // namespace

Recorder::Recorder(RecordOptions options) : options_(std::move(options)) {
}

std::string Recorder::formatDeviceLine(size_t index, const CaptureDevice& device) {
    return "  [" + std::to_string(index) + "] " + device.path + " - " + device.card;
}

std::optional<size_t> Recorder::chooseDevice(size_t device_count,
                                             std::optional<int> index,
                                             std::istream& input,
                                             std::string& error_message) {
    if (device_count == 0) {
        error_message = "No devices to choose from";
        return std::nullopt;
    }

    if (!index) {
        std::string line;
        if (!std::getline(input, line)) {
            error_message = "No device index given";
            return std::nullopt;
        }
        line = trim(line);
        int value;
        auto result = std::from_chars(line.data(), line.data() + line.size(), value);
        if (result.ec != std::errc() || result.ptr != line.data() + line.size()) {
            error_message = "Invalid device index: '" + line + "'";
            return std::nullopt;
        }
        index = value;
    }

    if (*index < 0 || static_cast<size_t>(*index) >= device_count) {
        error_message = "Invalid device index: " + std::to_string(*index) +
                        " (expected 0-" + std::to_string(device_count - 1) + ")";
        return std::nullopt;
    }
    return static_cast<size_t>(*index);
}

std::string Recorder::outputPath(std::chrono::system_clock::time_point now) const {
    const std::string name = "capture_" + CaptureJob::formatTimestamp(now) + ".mp4";
    return (std::filesystem::path(options_.output_dir) / name).string();
}

std::vector<std::string> Recorder::buildCommand(const std::string& device_path,
                                                const std::string& output_path) const {
    std::vector<std::string> command = {
        options_.ffmpeg_path,
        "-f", "v4l2",
        "-framerate", std::to_string(options_.fps),
        "-video_size", std::to_string(options_.width) + "x" + std::to_string(options_.height),
        "-i", device_path,
        "-c:v", "libx264",
        "-preset", "ultrafast",
    };
    if (options_.duration_seconds) {
        command.push_back("-t");
        command.push_back(std::to_string(*options_.duration_seconds));
    }
    command.push_back(output_path);
    return command;
}

bool Recorder::record(const CaptureDevice& device, const std::string& output_path,
                      std::string& error_message) const {
    std::error_code ec;
    std::filesystem::create_directories(options_.output_dir, ec);
    if (ec) {
        error_message = "Cannot create output directory " + options_.output_dir + ": " +
                        ec.message();
        return false;
    }

    // ffmpeg shares the terminal so that its progress and prompts stay visible
    ProcessOptions process;
    process.stdin_path.clear();
    process.stdout_path.clear();
    process.stderr_path.clear();

    auto command = buildCommand(device.path, output_path);
    Logger::info("Recording " + device.path + " to " + output_path);

    auto ffmpeg = Subprocess::spawn(command, process, error_message);
    if (!ffmpeg) {
        return false;
    }

    ExitStatus status;
    {
        IgnoreInterrupts guard;
        if (options_.duration_seconds) {
            status = ffmpeg->waitFor(std::chrono::seconds(*options_.duration_seconds) +
                                     kGracePeriod);
        } else {
            status = ffmpeg->wait();
        }
    }

    // ffmpeg exits with 255 after finalizing a file on Ctrl-C
    const bool interrupted = status.exited && status.exit_code == 255;
    if (!status.success() && !interrupted) {
        error_message = "ffmpeg " + status.describe();
        Logger::error("Recording " + output_path + " failed: " + error_message);
        return false;
    }

    if (!std::filesystem::is_regular_file(output_path, ec)) {
        error_message = "ffmpeg produced no output file";
        Logger::error("Recording " + output_path + " failed: " + error_message);
        return false;
    }

    Logger::info("Recording finished: " + output_path);
    return true;
}

} // namespace capture_bench
