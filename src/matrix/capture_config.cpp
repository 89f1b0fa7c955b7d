#include "matrix/capture_config.hpp"

namespace capture_bench {

namespace {

struct PixelFormatEntry {
    PixelFormat format;
    const char* name;
    const char* fourcc;
    const char* input_name;
    bool raw;
    Container container;
};

constexpr PixelFormatEntry kPixelFormats[] = {
    {PixelFormat::Mjpeg, "mjpeg", "MJPG", "mjpeg",   false, Container::Avi},
    {PixelFormat::Yuyv,  "yuyv",  "YUYV", "yuyv422", true,  Container::Mp4},
    {PixelFormat::Nv12,  "nv12",  "NV12", "nv12",    true,  Container::Mp4},
};

const PixelFormatEntry& entryFor(PixelFormat format) {
    for (const auto& entry : kPixelFormats) {
        if (entry.format == format) {
            return entry;
        }
    }
    return kPixelFormats[0];
}

} // namespace

const std::vector<PixelFormat>& allPixelFormats() {
    static const std::vector<PixelFormat> formats = {
        PixelFormat::Mjpeg, PixelFormat::Yuyv, PixelFormat::Nv12};
    return formats;
}

const std::vector<Encoder>& allEncoders() {
    static const std::vector<Encoder> encoders = {
        Encoder::Copy, Encoder::V4l2m2m, Encoder::Libx264};
    return encoders;
}

std::string pixelFormatName(PixelFormat format) {
    return entryFor(format).name;
}

std::string pixelFormatFourcc(PixelFormat format) {
    return entryFor(format).fourcc;
}

std::string pixelFormatInputName(PixelFormat format) {
    return entryFor(format).input_name;
}

bool isRawFormat(PixelFormat format) {
    return entryFor(format).raw;
}

std::optional<PixelFormat> pixelFormatFromName(const std::string& name) {
    for (const auto& entry : kPixelFormats) {
        if (name == entry.name) {
            return entry.format;
        }
    }
    return std::nullopt;
}

std::optional<PixelFormat> pixelFormatFromFourcc(const std::string& fourcc) {
    for (const auto& entry : kPixelFormats) {
        if (fourcc == entry.fourcc) {
            return entry.format;
        }
    }
    return std::nullopt;
}

std::string encoderName(Encoder encoder) {
    switch (encoder) {
        case Encoder::Copy:
            return "copy";
        case Encoder::V4l2m2m:
            return "v4l2m2m";
        case Encoder::Libx264:
            return "libx264";
    }
    return "unknown";
}

std::optional<Encoder> encoderFromName(const std::string& name) {
    for (Encoder encoder : allEncoders()) {
        if (encoderName(encoder) == name) {
            return encoder;
        }
    }
    return std::nullopt;
}

std::vector<std::string> encoderArguments(Encoder encoder) {
    switch (encoder) {
        case Encoder::Copy:
            return {"-c:v", "copy"};
        case Encoder::V4l2m2m:
            return {"-c:v", "h264_v4l2m2m", "-b:v", "5M"};
        case Encoder::Libx264:
            return {"-c:v", "libx264", "-preset", "ultrafast", "-crf", "23"};
    }
    return {};
}

Container containerForFormat(PixelFormat format) {
    return entryFor(format).container;
}

std::string containerExtension(Container container) {
    return container == Container::Avi ? "avi" : "mp4";
}

bool isCompatible(PixelFormat format, Encoder encoder) {
    return !(encoder == Encoder::Copy && isRawFormat(format) &&
             containerForFormat(format) == Container::Mp4);
}

std::string CaptureConfig::getResolutionString() const {
    return std::to_string(width) + "x" + std::to_string(height);
}

} // namespace capture_bench
