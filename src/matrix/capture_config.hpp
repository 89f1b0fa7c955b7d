#ifndef CAPTURE_CONFIG_HPP
#define CAPTURE_CONFIG_HPP

#include <string>
#include <optional>
#include <vector>

namespace capture_bench {

// Pixel formats the test matrix knows how to request from a capture device
enum class PixelFormat {
    Mjpeg,
    Yuyv,
    Nv12
};

// Encoder settings passed to ffmpeg for each job
enum class Encoder {
    Copy,
    V4l2m2m,
    Libx264
};

// Output container of the captured media file
enum class Container {
    Avi,
    Mp4
};

const std::vector<PixelFormat>& allPixelFormats();
const std::vector<Encoder>& allEncoders();

// Short name used in job names and on the command line ("mjpeg", "yuyv", "nv12")
std::string pixelFormatName(PixelFormat format);

// V4L2 fourcc as reported by VIDIOC_ENUM_FMT ("MJPG", "YUYV", "NV12")
std::string pixelFormatFourcc(PixelFormat format);

// ffmpeg v4l2 demuxer -input_format value ("mjpeg", "yuyv422", "nv12")
std::string pixelFormatInputName(PixelFormat format);

// True for unencoded formats that need a transcode to fit into MP4
bool isRawFormat(PixelFormat format);

std::optional<PixelFormat> pixelFormatFromName(const std::string& name);
std::optional<PixelFormat> pixelFormatFromFourcc(const std::string& fourcc);

std::string encoderName(Encoder encoder);
std::optional<Encoder> encoderFromName(const std::string& name);

// ffmpeg arguments selecting the video codec for this encoder
std::vector<std::string> encoderArguments(Encoder encoder);

// MJPEG stream copy goes into AVI, everything else into MP4
Container containerForFormat(PixelFormat format);
std::string containerExtension(Container container);

// Statically known incompatible combinations (raw video cannot be
// stream-copied into an MP4 container)
bool isCompatible(PixelFormat format, Encoder encoder);

// How jobs of one run may overlap
struct ConcurrencyPolicy {
    // 1 = sequential, 0 = unlimited
    int max_concurrent_jobs = 1;

    // Never run two jobs against the same capture device at once
    bool exclusive_devices = true;

    // Delay between job launches when running in parallel
    int stagger_ms = 1000;

    // Pause after each job when running sequentially
    int inter_job_delay_ms = 1000;

    bool isSequential() const { return max_concurrent_jobs == 1; }
};

struct CaptureConfig {
    // Recording length of each job in seconds
    int duration_seconds = 10;

    // Extra time on top of the duration before a capture is killed
    int grace_period_seconds = 10;

    int width = 1920;
    int height = 1080;
    int fps = 30;

    // Directory receiving media files, metrics logs and error logs
    std::string output_dir = "./results";

    std::vector<PixelFormat> formats = allPixelFormats();
    std::vector<Encoder> encoders = allEncoders();

    ConcurrencyPolicy policy;

    // Directory scanned for video nodes
    std::string dev_dir = "/dev";

    // ffmpeg binary used for capture and connectivity probes
    std::string ffmpeg_path = "ffmpeg";

    // Executable providing the "sample" subcommand (default: this program)
    std::string sampler_executable;

    // Grab a single frame from each device before testing it
    bool probe_connectivity = true;

    std::string getResolutionString() const;
};

} // namespace capture_bench

#endif // CAPTURE_CONFIG_HPP
