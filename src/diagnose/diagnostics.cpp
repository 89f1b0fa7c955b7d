#include "diagnose/diagnostics.hpp"
#include "device/device_enumerator.hpp"
#include "monitor/memory_monitor.hpp"
#include "monitor/system_info.hpp"
#include "process/subprocess.hpp"
#include "utils/output_formatter.hpp"
#include "utils/logger.hpp"
#include <grp.h>
#include <pwd.h>
#include <unistd.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>

namespace capture_bench {

namespace {

const char* const kCaptureKeywords[] = {"video", "capture", "cam", "elgato", "aver", "haup"};

// Lines printed from a failed capture test
constexpr size_t kCaptureErrorLines = 5;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void section(const std::string& title) {
    OutputFormatter::printBlankLine();
    OutputFormatter::printLine("--- " + title + " ---");
}

} // anonymous namespace

Diagnostics::Diagnostics(DiagnosticsOptions options)
    : options_(std::move(options)) {
}

bool Diagnostics::isCaptureRelatedUsbLine(const std::string& line) {
    const std::string lower = toLower(line);
    for (const char* keyword : kCaptureKeywords) {
        if (lower.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> Diagnostics::lastLines(const std::string& path, size_t count) {
    std::deque<std::string> tail;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        tail.push_back(line);
        if (tail.size() > count) {
            tail.pop_front();
        }
    }
    return std::vector<std::string>(tail.begin(), tail.end());
}

bool Diagnostics::userInGroup(const std::string& group) {
    const struct group* entry = ::getgrnam(group.c_str());
    if (!entry) {
        return false;
    }
    const gid_t target = entry->gr_gid;

    if (::getegid() == target) {
        return true;
    }

    // Supplementary groups of the running process
    int count = ::getgroups(0, nullptr);
    if (count > 0) {
        std::vector<gid_t> groups(static_cast<size_t>(count));
        count = ::getgroups(count, groups.data());
        for (int i = 0; i < count; i++) {
            if (groups[static_cast<size_t>(i)] == target) {
                return true;
            }
        }
    }

    // Membership granted after login is only visible in the group database
    const struct passwd* pw = ::getpwuid(::getuid());
    if (!pw) {
        return false;
    }
    int ngroups = 64;
    std::vector<gid_t> user_groups(static_cast<size_t>(ngroups));
    if (::getgrouplist(pw->pw_name, pw->pw_gid, user_groups.data(), &ngroups) < 0) {
        user_groups.resize(static_cast<size_t>(ngroups));
        if (::getgrouplist(pw->pw_name, pw->pw_gid, user_groups.data(), &ngroups) < 0) {
            return false;
        }
    }
    user_groups.resize(static_cast<size_t>(ngroups));
    return std::find(user_groups.begin(), user_groups.end(), target) != user_groups.end();
}

void Diagnostics::printSystem() const {
    section("System");
    OutputFormatter::printLine("OS: " + SystemInfo::getOsName());
    OutputFormatter::printLine("Kernel: " + SystemInfo::getKernelRelease());
    OutputFormatter::printLine("Architecture: " + SystemInfo::getArchitecture());
    OutputFormatter::printLine("CPU: " + SystemInfo::getCpuName() + " (" +
                               std::to_string(SystemInfo::getThreadCount()) + " threads)");
    OutputFormatter::printLine("Memory: " +
                               std::to_string(MemoryMonitor::create()->getTotalSystemMemoryMB()) + " MB");
}

bool Diagnostics::checkFfmpeg() const {
    section("FFmpeg");
    auto ffmpeg = Subprocess::findExecutable(options_.ffmpeg_path);
    if (!ffmpeg) {
        OutputFormatter::printLine("\xE2\x9D\x8C ffmpeg not found (install with: sudo apt install ffmpeg)");
        return false;
    }
    OutputFormatter::printLine("\xE2\x9C\x85 ffmpeg found: " + *ffmpeg);
    return true;
}

std::vector<std::string> Diagnostics::listDevices() const {
    section("Video devices");
    std::vector<std::string> nodes = DeviceEnumerator::listVideoNodes(options_.dev_dir);
    if (nodes.empty()) {
        OutputFormatter::printLine("No " + options_.dev_dir + "/video* devices found");
        return nodes;
    }

    for (const auto& node : nodes) {
        std::string error;
        auto device = DeviceEnumerator::query(node, error);
        if (!device) {
            OutputFormatter::printLine(node + ": " + error);
            continue;
        }
        std::string line = node + ": " + device->card + " [" + device->driver + "]";
        if (!device->fourccs.empty()) {
            line += " formats: " + device->getFourccList();
        }
        OutputFormatter::printLine(line);
    }
    return nodes;
}

void Diagnostics::checkGroup() const {
    section("Permissions");
    if (userInGroup("video")) {
        OutputFormatter::printLine("\xE2\x9C\x85 User is in the 'video' group");
    } else {
        OutputFormatter::printLine("\xE2\x9A\xA0\xEF\xB8\x8F  User is not in the 'video' group "
                                   "(fix: sudo usermod -a -G video $USER, then log in again)");
    }
}

void Diagnostics::listUsbDevices() const {
    section("USB devices");
    std::unique_ptr<FILE, decltype(&pclose)> pipe(
        popen("lsusb 2>/dev/null", "r"), pclose);
    if (!pipe) {
        OutputFormatter::printLine("lsusb could not be run");
        return;
    }

    bool any = false;
    std::array<char, 512> buffer{};
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get())) {
        std::string line(buffer.data());
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
        }
        if (isCaptureRelatedUsbLine(line)) {
            OutputFormatter::printLine(line);
            any = true;
        }
    }
    if (!any) {
        OutputFormatter::printLine("No video-related USB devices reported by lsusb");
    }
}

void Diagnostics::captureTest(const std::string& device) const {
    section("Capture test");
    OutputFormatter::printLine("Reading one frame from " + device + "...");

    const std::string error_path =
        (std::filesystem::temp_directory_path() /
         ("hdmi-capture-bench-diagnose-" + std::to_string(::getpid()) + ".log")).string();

    ProcessOptions process_options;
    process_options.stderr_path = error_path;

    std::string error;
    auto capture = Subprocess::spawn(
        {options_.ffmpeg_path, "-f", "v4l2", "-i", device, "-frames:v", "1", "-f", "null", "-"},
        process_options, error);
    if (!capture) {
        OutputFormatter::printLine("\xE2\x9D\x8C " + error);
        return;
    }

    ExitStatus status = capture->waitFor(std::chrono::seconds(options_.capture_test_seconds));
    if (status.success()) {
        OutputFormatter::printLine("\xE2\x9C\x85 Capture test succeeded");
    } else {
        OutputFormatter::printLine("\xE2\x9D\x8C Capture test failed (" + status.describe() + ")");
        for (const auto& line : lastLines(error_path, kCaptureErrorLines)) {
            OutputFormatter::printLine("    " + line);
        }
    }

    std::error_code ec;
    std::filesystem::remove(error_path, ec);
}

void Diagnostics::printHints() const {
    section("If issues persist");
    OutputFormatter::printLine("1. Reboot and try again");
    OutputFormatter::printLine("2. Check dmesg for USB/device errors");
    OutputFormatter::printLine("3. Try different USB ports");
    OutputFormatter::printLine("4. Update system: sudo apt update && sudo apt upgrade");
}

void Diagnostics::run() const {
    Logger::info("Running diagnostics");
    OutputFormatter::printLine("HDMI capture diagnostics");

    printSystem();
    const bool has_ffmpeg = checkFfmpeg();
    std::vector<std::string> devices = listDevices();
    checkGroup();
    listUsbDevices();

    if (!devices.empty() && has_ffmpeg) {
        captureTest(devices.front());
    }

    printHints();
}

} // namespace capture_bench
