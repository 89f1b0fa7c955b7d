#include "record/recorder.hpp"
#include "matrix/capture_job.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace capture_bench;

namespace {

CaptureDevice makeDevice() {
    CaptureDevice device;
    device.path = "/dev/video2";
    device.card = "USB3.0 HD Video Capture";
    device.driver = "uvcvideo";
    device.bus_info = "usb-0000:01:00.0-1.4";
    device.fourccs = {"MJPG", "YUYV"};
    return device;
}

} // namespace

TEST(Recorder, DeviceLine) {
    EXPECT_EQ(Recorder::formatDeviceLine(1, makeDevice()),
              "  [1] /dev/video2 - USB3.0 HD Video Capture");
}

TEST(Recorder, ChooseDeviceFromOption) {
    std::istringstream input;
    std::string error;
    EXPECT_EQ(Recorder::chooseDevice(3, 2, input, error), std::optional<size_t>(2));

    EXPECT_FALSE(Recorder::chooseDevice(3, 3, input, error).has_value());
    EXPECT_EQ(error, "Invalid device index: 3 (expected 0-2)");
}

TEST(Recorder, ChooseDeviceFromInput) {
    std::string error;
    std::istringstream typed(" 1 \n");
    EXPECT_EQ(Recorder::chooseDevice(2, std::nullopt, typed, error), std::optional<size_t>(1));

    std::istringstream garbage("first\n");
    EXPECT_FALSE(Recorder::chooseDevice(2, std::nullopt, garbage, error).has_value());
    EXPECT_EQ(error, "Invalid device index: 'first'");

    std::istringstream closed;
    EXPECT_FALSE(Recorder::chooseDevice(2, std::nullopt, closed, error).has_value());
    EXPECT_EQ(error, "No device index given");

    std::istringstream any("0\n");
    EXPECT_FALSE(Recorder::chooseDevice(0, std::nullopt, any, error).has_value());
}

TEST(Recorder, OutputPathUsesTimestamp) {
    RecordOptions options;
    options.output_dir = "/tmp/captures";
    Recorder recorder(options);

    auto now = std::chrono::system_clock::now();
    EXPECT_EQ(recorder.outputPath(now),
              "/tmp/captures/capture_" + CaptureJob::formatTimestamp(now) + ".mp4");
}

TEST(Recorder, CommandLine) {
    RecordOptions options;
    options.ffmpeg_path = "/usr/bin/ffmpeg";
    Recorder recorder(options);

    EXPECT_EQ(recorder.buildCommand("/dev/video2", "capture_20240101_120000.mp4"),
              (std::vector<std::string>{"/usr/bin/ffmpeg", "-f", "v4l2", "-framerate", "30",
                                        "-video_size", "1920x1080", "-i", "/dev/video2",
                                        "-c:v", "libx264", "-preset", "ultrafast",
                                        "capture_20240101_120000.mp4"}));

    options.duration_seconds = 5;
    options.width = 1280;
    options.height = 720;
    auto command = Recorder(options).buildCommand("/dev/video2", "out.mp4");
    ASSERT_GE(command.size(), 3u);
    EXPECT_EQ(command[6], "1280x720");
    EXPECT_EQ(command[command.size() - 3], "-t");
    EXPECT_EQ(command[command.size() - 2], "5");
    EXPECT_EQ(command.back(), "out.mp4");
}

TEST(Recorder, RecordsWithFfmpeg) {
    test::TempDir dir;
    RecordOptions options;
    options.duration_seconds = 1;
    options.output_dir = dir.file("captures");
    options.ffmpeg_path = test::writeScript(
        dir.file("ffmpeg"), "for last; do :; done\necho frames > \"$last\"\nexit 0");
    Recorder recorder(options);

    const std::string output = recorder.outputPath(std::chrono::system_clock::now());
    std::string error;
    ASSERT_TRUE(recorder.record(makeDevice(), output, error)) << error;
    EXPECT_EQ(test::readFile(output), "frames\n");
}

TEST(Recorder, FailedFfmpegIsReported) {
    test::TempDir dir;
    RecordOptions options;
    options.duration_seconds = 1;
    options.output_dir = dir.path().string();
    options.ffmpeg_path = test::writeScript(dir.file("ffmpeg"), "exit 1");
    Recorder recorder(options);

    std::string error;
    EXPECT_FALSE(recorder.record(makeDevice(), dir.file("capture.mp4"), error));
    EXPECT_EQ(error, "ffmpeg exit status 1");
}

TEST(Recorder, MissingOutputIsReported) {
    test::TempDir dir;
    RecordOptions options;
    options.duration_seconds = 1;
    options.output_dir = dir.path().string();
    options.ffmpeg_path = test::writeScript(dir.file("ffmpeg"), "exit 0");
    Recorder recorder(options);

    std::string error;
    EXPECT_FALSE(recorder.record(makeDevice(), dir.file("capture.mp4"), error));
    EXPECT_EQ(error, "ffmpeg produced no output file");
}
