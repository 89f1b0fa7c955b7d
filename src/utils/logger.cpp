#include "utils/logger.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <mutex>

namespace capture_bench {
namespace {

constexpr const char* kLoggerName = "hdmi_capture_bench";

// Sessions append to one file; keep it bounded
constexpr size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr size_t kMaxRotatedFiles = 3;

// Thread id separates the lines of concurrent capture jobs
constexpr const char* kLogPattern = "%Y-%m-%d %H:%M:%S.%e [%l] [%t] %v";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

std::shared_ptr<spdlog::logger> getLogger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return g_logger;
}

void write(spdlog::level::level_enum level, std::string_view message) {
    if (auto logger = getLogger()) {
        logger->log(level, "{}", message);
    }
}

} // namespace

std::string Logger::defaultLogFilePath() {
    return "hdmi-capture-bench.log";
}

bool Logger::initialize(const std::string& log_file_path, std::string& error_message) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (g_logger) {
        return true;
    }

    try {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file_path, kMaxLogFileBytes, kMaxRotatedFiles);
        file_sink->set_pattern(kLogPattern);

        g_logger = std::make_shared<spdlog::logger>(kLoggerName, file_sink);
        g_logger->set_level(spdlog::level::info);
        g_logger->flush_on(spdlog::level::info);
        spdlog::register_logger(g_logger);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        error_message = ex.what();
        g_logger.reset();
        return false;
    }
}

void Logger::info(std::string_view message) {
    write(spdlog::level::info, message);
}

void Logger::warn(std::string_view message) {
    write(spdlog::level::warn, message);
}

void Logger::error(std::string_view message) {
    write(spdlog::level::err, message);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (!g_logger) {
        return;
    }

    g_logger->flush();
    spdlog::drop(kLoggerName);
    g_logger.reset();
}

} // namespace capture_bench
