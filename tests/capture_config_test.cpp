#include "matrix/capture_config.hpp"
#include <gtest/gtest.h>

using namespace capture_bench;

TEST(PixelFormatTable, NamesFourccsAndInputFormats) {
    EXPECT_EQ(pixelFormatName(PixelFormat::Mjpeg), "mjpeg");
    EXPECT_EQ(pixelFormatFourcc(PixelFormat::Mjpeg), "MJPG");
    EXPECT_EQ(pixelFormatInputName(PixelFormat::Mjpeg), "mjpeg");

    EXPECT_EQ(pixelFormatName(PixelFormat::Yuyv), "yuyv");
    EXPECT_EQ(pixelFormatFourcc(PixelFormat::Yuyv), "YUYV");
    EXPECT_EQ(pixelFormatInputName(PixelFormat::Yuyv), "yuyv422");

    EXPECT_EQ(pixelFormatName(PixelFormat::Nv12), "nv12");
    EXPECT_EQ(pixelFormatFourcc(PixelFormat::Nv12), "NV12");
    EXPECT_EQ(pixelFormatInputName(PixelFormat::Nv12), "nv12");
}

TEST(PixelFormatTable, LookupByNameAndFourcc) {
    EXPECT_EQ(pixelFormatFromName("yuyv"), PixelFormat::Yuyv);
    EXPECT_EQ(pixelFormatFromFourcc("NV12"), PixelFormat::Nv12);
    EXPECT_FALSE(pixelFormatFromName("YUYV").has_value());
    EXPECT_FALSE(pixelFormatFromFourcc("H264").has_value());
}

TEST(PixelFormatTable, RawFormatsGoIntoMp4) {
    EXPECT_FALSE(isRawFormat(PixelFormat::Mjpeg));
    EXPECT_TRUE(isRawFormat(PixelFormat::Yuyv));
    EXPECT_TRUE(isRawFormat(PixelFormat::Nv12));

    EXPECT_EQ(containerForFormat(PixelFormat::Mjpeg), Container::Avi);
    EXPECT_EQ(containerForFormat(PixelFormat::Yuyv), Container::Mp4);
    EXPECT_EQ(containerForFormat(PixelFormat::Nv12), Container::Mp4);
    EXPECT_EQ(containerExtension(Container::Avi), "avi");
    EXPECT_EQ(containerExtension(Container::Mp4), "mp4");
}

TEST(EncoderTable, ArgumentsSelectCodec) {
    EXPECT_EQ(encoderArguments(Encoder::Copy), (std::vector<std::string>{"-c:v", "copy"}));
    EXPECT_EQ(encoderArguments(Encoder::V4l2m2m),
              (std::vector<std::string>{"-c:v", "h264_v4l2m2m", "-b:v", "5M"}));
    EXPECT_EQ(encoderArguments(Encoder::Libx264),
              (std::vector<std::string>{"-c:v", "libx264", "-preset", "ultrafast", "-crf", "23"}));
}

TEST(EncoderTable, NamesRoundTrip) {
    for (Encoder encoder : allEncoders()) {
        EXPECT_EQ(encoderFromName(encoderName(encoder)), encoder);
    }
    EXPECT_FALSE(encoderFromName("x265").has_value());
}

TEST(Compatibility, CopyOfRawFormatIsRejected) {
    EXPECT_TRUE(isCompatible(PixelFormat::Mjpeg, Encoder::Copy));
    EXPECT_FALSE(isCompatible(PixelFormat::Yuyv, Encoder::Copy));
    EXPECT_FALSE(isCompatible(PixelFormat::Nv12, Encoder::Copy));

    for (PixelFormat format : allPixelFormats()) {
        EXPECT_TRUE(isCompatible(format, Encoder::V4l2m2m));
        EXPECT_TRUE(isCompatible(format, Encoder::Libx264));
    }
}

TEST(CaptureConfigDefaults, MatchCommandLineDefaults) {
    CaptureConfig config;
    EXPECT_EQ(config.duration_seconds, 10);
    EXPECT_EQ(config.getResolutionString(), "1920x1080");
    EXPECT_EQ(config.fps, 30);
    EXPECT_EQ(config.output_dir, "./results");
    EXPECT_EQ(config.formats.size(), 3u);
    EXPECT_EQ(config.encoders.size(), 3u);
    EXPECT_TRUE(config.policy.isSequential());
    EXPECT_TRUE(config.policy.exclusive_devices);
}
