#ifndef SYSTEM_INFO_HPP
#define SYSTEM_INFO_HPP

#include <string>

namespace capture_bench {

class SystemInfo {
public:
    // Get CPU model name
    static std::string getCpuName();

    // Get number of hardware threads
    static unsigned int getThreadCount();

    // PRETTY_NAME from /etc/os-release
    static std::string getOsName(const std::string& os_release_path = "/etc/os-release");

    // uname -r
    static std::string getKernelRelease();

    // uname -m
    static std::string getArchitecture();
};

} // namespace capture_bench

#endif // SYSTEM_INFO_HPP
