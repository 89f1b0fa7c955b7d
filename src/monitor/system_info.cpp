#include "monitor/system_info.hpp"
#include <sys/utsname.h>
#include <fstream>
#include <thread>

namespace {

std::string trimLeading(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    return (start != std::string::npos) ? s.substr(start) : "";
}

std::string parseCpuinfoField(const std::string& field) {
    std::ifstream cpuinfo("/proc/cpuinfo");
    std::string line;
    while (std::getline(cpuinfo, line)) {
        if (line.find(field) == 0) {
            size_t pos = line.find(':');
            if (pos != std::string::npos) {
                return trimLeading(line.substr(pos + 1));
            }
        }
    }
    return "";
}

std::string tryDeviceTreeModel() {
    std::ifstream file("/sys/firmware/devicetree/base/model");
    if (!file.is_open()) return "";
    std::string model;
    std::getline(file, model);
    // Device tree strings may contain a trailing null byte
    if (!model.empty() && model.back() == '\0') {
        model.pop_back();
    }
    return trimLeading(model);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

} // anonymous namespace

namespace capture_bench {

std::string SystemInfo::getCpuName() {
    // x86 standard
    std::string name = parseCpuinfoField("model name");
    if (!name.empty()) return name;

    // Some ARM boards
    name = parseCpuinfoField("Hardware");
    if (!name.empty()) return name;

    // Raspberry Pi and other device-tree boards
    name = tryDeviceTreeModel();
    if (!name.empty()) return name;

    return "Unknown CPU";
}

unsigned int SystemInfo::getThreadCount() {
    unsigned int count = std::thread::hardware_concurrency();
    return count > 0 ? count : 1;
}

std::string SystemInfo::getOsName(const std::string& os_release_path) {
    std::ifstream os_release(os_release_path);
    std::string line;
    while (std::getline(os_release, line)) {
        if (line.rfind("PRETTY_NAME=", 0) == 0) {
            return unquote(line.substr(12));
        }
    }
    return "Unknown";
}

std::string SystemInfo::getKernelRelease() {
    struct utsname info;
    if (uname(&info) != 0) {
        return "Unknown";
    }
    return info.release;
}

std::string SystemInfo::getArchitecture() {
    struct utsname info;
    if (uname(&info) != 0) {
        return "Unknown";
    }
    return info.machine;
}

} // namespace capture_bench
