#include "device/device_enumerator.hpp"
#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace capture_bench {

namespace {

constexpr const char* kVideoNodePrefix = "video";

int xioctl(int fd, unsigned long request, void* arg) {
    int r;
    do {
        r = ioctl(fd, request, arg);
    } while (r == -1 && errno == EINTR);
    return r;
}

// Closes the descriptor when the query returns
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string fromCString(const __u8* data, size_t size) {
    const char* chars = reinterpret_cast<const char*>(data);
    return std::string(chars, strnlen(chars, size));
}

// Numeric suffix of "videoN", or -1
long nodeIndex(const std::string& name) {
    std::string digits = name.substr(std::strlen(kVideoNodePrefix));
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
        return -1;
    }
    return std::strtol(digits.c_str(), nullptr, 10);
}

} // namespace

std::string CaptureDevice::basename() const {
    return std::filesystem::path(path).filename().string();
}

bool CaptureDevice::looksLikeCaptureHardware() const {
    const std::string haystack = toLower(bus_info + " " + card + " " + driver);
    return haystack.find("usb") != std::string::npos ||
           haystack.find("hdmi") != std::string::npos;
}

bool CaptureDevice::supportsFourcc(const std::string& fourcc) const {
    return std::find(fourccs.begin(), fourccs.end(), fourcc) != fourccs.end();
}

std::string CaptureDevice::getFourccList() const {
    std::string list;
    for (const auto& fourcc : fourccs) {
        if (!list.empty()) list += ' ';
        list += fourcc;
    }
    return list;
}

std::string DeviceEnumerator::fourccToString(uint32_t fourcc) {
    std::string s;
    for (int i = 0; i < 4; i++) {
        char c = static_cast<char>((fourcc >> (8 * i)) & 0xFF);
        if (c != ' ' && c != '\0') {
            s += c;
        }
    }
    return s;
}

std::vector<std::string> DeviceEnumerator::listVideoNodes(const std::string& dev_dir) {
    std::vector<std::pair<long, std::string>> nodes;

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dev_dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind(kVideoNodePrefix, 0) != 0) {
            continue;
        }
        long index = nodeIndex(name);
        if (index < 0) {
            continue;
        }
        std::error_code type_ec;
        if (!entry.is_character_file(type_ec)) {
            continue;
        }
        nodes.emplace_back(index, entry.path().string());
    }

    std::sort(nodes.begin(), nodes.end());

    std::vector<std::string> paths;
    paths.reserve(nodes.size());
    for (auto& node : nodes) {
        paths.push_back(std::move(node.second));
    }
    return paths;
}

std::optional<CaptureDevice> DeviceEnumerator::query(const std::string& path,
                                                     std::string& error_message) {
    ScopedFd fd(::open(path.c_str(), O_RDWR | O_NONBLOCK, 0));
    if (fd.get() < 0) {
        error_message = "cannot open device: " + std::string(std::strerror(errno));
        return std::nullopt;
    }

    struct v4l2_capability cap;
    std::memset(&cap, 0, sizeof(cap));
    if (xioctl(fd.get(), VIDIOC_QUERYCAP, &cap) < 0) {
        error_message = "VIDIOC_QUERYCAP failed: " + std::string(std::strerror(errno));
        return std::nullopt;
    }

    uint32_t caps = (cap.capabilities & V4L2_CAP_DEVICE_CAPS) ? cap.device_caps
                                                              : cap.capabilities;

    uint32_t buf_type;
    if (caps & V4L2_CAP_VIDEO_CAPTURE) {
        buf_type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    } else if (caps & V4L2_CAP_VIDEO_CAPTURE_MPLANE) {
        buf_type = V4L2_BUF_TYPE_VIDEO_CAPTURE_MPLANE;
    } else {
        error_message = "not a video capture node";
        return std::nullopt;
    }

    CaptureDevice device;
    device.path = path;
    device.card = fromCString(cap.card, sizeof(cap.card));
    device.driver = fromCString(cap.driver, sizeof(cap.driver));
    device.bus_info = fromCString(cap.bus_info, sizeof(cap.bus_info));

    for (uint32_t index = 0;; index++) {
        struct v4l2_fmtdesc desc;
        std::memset(&desc, 0, sizeof(desc));
        desc.index = index;
        desc.type = buf_type;
        if (xioctl(fd.get(), VIDIOC_ENUM_FMT, &desc) < 0) {
            // EINVAL marks the end of the list; anything else means the
            // device is busy or gone, and whatever was listed so far stands
            break;
        }
        device.fourccs.push_back(fourccToString(desc.pixelformat));
    }

    std::sort(device.fourccs.begin(), device.fourccs.end());
    device.fourccs.erase(std::unique(device.fourccs.begin(), device.fourccs.end()),
                         device.fourccs.end());

    return device;
}

DeviceEnumerator::Result DeviceEnumerator::filter(std::vector<CaptureDevice> candidates) {
    Result result;

    for (auto& device : candidates) {
        if (!device.looksLikeCaptureHardware()) {
            result.excluded.push_back({device.path, "not an HDMI/USB capture device (" +
                                                        device.card + ")"});
            continue;
        }
        if (device.fourccs.empty()) {
            result.excluded.push_back({device.path, "no supported formats (" +
                                                        device.card + ")"});
            continue;
        }
        result.devices.push_back(std::move(device));
    }

    return result;
}

DeviceEnumerator::Result DeviceEnumerator::enumerate(const std::string& dev_dir) {
    std::vector<CaptureDevice> candidates;
    std::vector<Exclusion> unreachable;

    for (const auto& path : listVideoNodes(dev_dir)) {
        std::string error;
        auto device = query(path, error);
        if (!device) {
            unreachable.push_back({path, error});
            continue;
        }
        candidates.push_back(std::move(*device));
    }

    Result result = filter(std::move(candidates));
    result.excluded.insert(result.excluded.begin(), unreachable.begin(), unreachable.end());
    return result;
}

} // namespace capture_bench
