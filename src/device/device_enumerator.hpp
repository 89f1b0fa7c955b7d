#ifndef DEVICE_ENUMERATOR_HPP
#define DEVICE_ENUMERATOR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace capture_bench {

// A V4L2 video node as reported by VIDIOC_QUERYCAP / VIDIOC_ENUM_FMT
struct CaptureDevice {
    std::string path;       // e.g. "/dev/video0"
    std::string card;
    std::string driver;
    std::string bus_info;
    std::vector<std::string> fourccs;  // sorted, unique

    // "video0" for "/dev/video0"
    std::string basename() const;

    // Bus info, card or driver mention USB or HDMI
    bool looksLikeCaptureHardware() const;

    bool supportsFourcc(const std::string& fourcc) const;

    // "MJPG YUYV"
    std::string getFourccList() const;
};

class DeviceEnumerator {
public:
    struct Exclusion {
        std::string path;
        std::string reason;
    };

    struct Result {
        std::vector<CaptureDevice> devices;
        std::vector<Exclusion> excluded;
    };

    // All /dev/video* character devices, ordered by index
    static std::vector<std::string> listVideoNodes(const std::string& dev_dir = "/dev");

    // Query one node, or nullopt if it does not answer the device-info query
    static std::optional<CaptureDevice> query(const std::string& path,
                                              std::string& error_message);

    // Capture devices that answer the query and advertise at least one format
    static Result enumerate(const std::string& dev_dir = "/dev");

    // Keep usable devices out of already-queried candidates
    static Result filter(std::vector<CaptureDevice> candidates);

    static std::string fourccToString(uint32_t fourcc);

private:
    DeviceEnumerator() = delete;
};

} // namespace capture_bench

#endif // DEVICE_ENUMERATOR_HPP
