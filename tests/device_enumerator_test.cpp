#include "device/device_enumerator.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace capture_bench;

namespace {

CaptureDevice device(const std::string& path, const std::string& card,
                     const std::string& driver, const std::string& bus_info,
                     std::vector<std::string> fourccs) {
    CaptureDevice d;
    d.path = path;
    d.card = card;
    d.driver = driver;
    d.bus_info = bus_info;
    d.fourccs = std::move(fourccs);
    return d;
}

uint32_t fourcc(char a, char b, char c, char d) {
    return static_cast<uint32_t>(a) | (static_cast<uint32_t>(b) << 8) |
           (static_cast<uint32_t>(c) << 16) | (static_cast<uint32_t>(d) << 24);
}

} // namespace

TEST(DeviceEnumerator, FourccToString) {
    EXPECT_EQ(DeviceEnumerator::fourccToString(fourcc('M', 'J', 'P', 'G')), "MJPG");
    EXPECT_EQ(DeviceEnumerator::fourccToString(fourcc('Y', 'U', 'Y', 'V')), "YUYV");
    EXPECT_EQ(DeviceEnumerator::fourccToString(fourcc('Y', '1', '0', ' ')), "Y10");
}

TEST(DeviceEnumerator, FilterKeepsUsbAndHdmiDevicesWithFormats) {
    auto result = DeviceEnumerator::filter({
        device("/dev/video0", "Cam Link 4K: Cam Link 4K", "uvcvideo",
               "usb-0000:01:00.0-1.2", {"NV12", "YUYV"}),
        device("/dev/video10", "bcm2835-codec-decode", "bcm2835-codec",
               "platform:bcm2835-codec", {"H264"}),
        device("/dev/video1", "USB Video: USB Video", "uvcvideo",
               "usb-0000:01:00.0-1.3", {}),
        device("/dev/video2", "unicam", "unicam", "platform:fe801000.csi HDMI", {"UYVY"}),
    });

    ASSERT_EQ(result.devices.size(), 2u);
    EXPECT_EQ(result.devices[0].path, "/dev/video0");
    EXPECT_EQ(result.devices[1].path, "/dev/video2");

    ASSERT_EQ(result.excluded.size(), 2u);
    EXPECT_EQ(result.excluded[0].path, "/dev/video10");
    EXPECT_EQ(result.excluded[0].reason,
              "not an HDMI/USB capture device (bcm2835-codec-decode)");
    EXPECT_EQ(result.excluded[1].path, "/dev/video1");
    EXPECT_EQ(result.excluded[1].reason, "no supported formats (USB Video: USB Video)");
}

TEST(DeviceEnumerator, FilterOfNothingIsEmpty) {
    auto result = DeviceEnumerator::filter({});
    EXPECT_TRUE(result.devices.empty());
    EXPECT_TRUE(result.excluded.empty());
}

TEST(DeviceEnumerator, ListIgnoresNonDeviceFiles) {
    test::TempDir dir;
    test::writeFile(dir.file("video0"), "");
    test::writeFile(dir.file("videobuf"), "");
    EXPECT_TRUE(DeviceEnumerator::listVideoNodes(dir.path().string()).empty());
}

TEST(DeviceEnumerator, QueryOfMissingNodeFails) {
    std::string error;
    EXPECT_FALSE(DeviceEnumerator::query("/nonexistent/video0", error).has_value());
    EXPECT_NE(error.find("cannot open device"), std::string::npos);
}

TEST(CaptureDevice, Accessors) {
    auto d = device("/dev/video3", "Cam", "uvcvideo", "usb-1", {"MJPG", "YUYV"});
    EXPECT_EQ(d.basename(), "video3");
    EXPECT_EQ(d.getFourccList(), "MJPG YUYV");
    EXPECT_TRUE(d.supportsFourcc("YUYV"));
    EXPECT_FALSE(d.supportsFourcc("NV12"));
    EXPECT_TRUE(d.looksLikeCaptureHardware());
}
