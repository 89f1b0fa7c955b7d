#ifndef DIAGNOSTICS_HPP
#define DIAGNOSTICS_HPP

#include <string>
#include <vector>

namespace capture_bench {

struct DiagnosticsOptions {
    std::string ffmpeg_path = "ffmpeg";
    std::string dev_dir = "/dev";
    int capture_test_seconds = 3;
};

// Environment report for a machine that finds no capture devices.
// Every check prints its own finding; none of them is fatal.
class Diagnostics {
public:
    explicit Diagnostics(DiagnosticsOptions options = DiagnosticsOptions());

    void run() const;

    // lsusb line that names a video or capture vendor/product
    static bool isCaptureRelatedUsbLine(const std::string& line);

    // Up to count trailing lines of a text file
    static std::vector<std::string> lastLines(const std::string& path, size_t count);

    // True if the calling user belongs to the named group
    static bool userInGroup(const std::string& group);

private:
    void printSystem() const;
    bool checkFfmpeg() const;
    std::vector<std::string> listDevices() const;
    void checkGroup() const;
    void listUsbDevices() const;
    void captureTest(const std::string& device) const;
    void printHints() const;

    DiagnosticsOptions options_;
};

} // namespace capture_bench

#endif // DIAGNOSTICS_HPP
