#ifndef RECORDER_HPP
#define RECORDER_HPP

#include "device/device_enumerator.hpp"
#include <chrono>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace capture_bench {

struct RecordOptions {
    // Index into the listed devices; asked for on stdin when unset
    std::optional<int> device_index;

    int width = 1920;
    int height = 1080;
    int fps = 30;

    // Recording length; unset records until ffmpeg is interrupted
    std::optional<int> duration_seconds;

    std::string output_dir = ".";
    std::string ffmpeg_path = "ffmpeg";

    // Directory scanned for video nodes
    std::string dev_dir = "/dev";
};

// Interactive single-device H.264 recording
class Recorder {
public:
    explicit Recorder(RecordOptions options);

    // "  [0] /dev/video0 - Cam Link 4K"
    static std::string formatDeviceLine(size_t index, const CaptureDevice& device);

    // Resolve the device index from the option or, when unset, from one
    // line of input. Fails on anything outside [0, device_count).
    static std::optional<size_t> chooseDevice(size_t device_count,
                                              std::optional<int> index,
                                              std::istream& input,
                                              std::string& error_message);

    // "<output_dir>/capture_YYYYmmdd_HHMMSS.mp4"
    std::string outputPath(std::chrono::system_clock::time_point now) const;

    std::vector<std::string> buildCommand(const std::string& device_path,
                                          const std::string& output_path) const;

    // Run ffmpeg on the terminal until it exits. Ctrl-C stops the
    // recording, not this program.
    bool record(const CaptureDevice& device, const std::string& output_path,
                std::string& error_message) const;

private:
    RecordOptions options_;
};

} // namespace capture_bench

#endif // RECORDER_HPP
