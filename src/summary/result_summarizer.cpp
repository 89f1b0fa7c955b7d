#include "summary/result_summarizer.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>

namespace capture_bench {

namespace {

constexpr const char* kLogExtension = ".log";
constexpr const char* kErrorLogSuffix = ".error.log";
constexpr const char* kMediaExtensions[] = {".mp4", ".avi"};

double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Mean (or max) of the set values of one column
struct ColumnStats {
    double sum = 0.0;
    double max = 0.0;
    size_t count = 0;

    void add(const std::optional<double>& value) {
        if (!value) {
            return;
        }
        max = count == 0 ? *value : std::max(max, *value);
        sum += *value;
        count++;
    }

    double mean() const {
        return count > 0 ? sum / static_cast<double>(count) : 0.0;
    }
};

} // namespace

ResultSummarizer::ResultSummarizer(std::string results_dir)
    : results_dir_(std::move(results_dir)) {
}

std::vector<std::filesystem::path> ResultSummarizer::findLogFiles(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> logs;

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (endsWith(name, kLogExtension) && !endsWith(name, kErrorLogSuffix)) {
            logs.push_back(entry.path());
        }
    }

    std::sort(logs.begin(), logs.end());
    return logs;
}

std::optional<std::filesystem::path> ResultSummarizer::findMediaFile(
        const std::filesystem::path& log_path) {
    for (const char* extension : kMediaExtensions) {
        std::filesystem::path candidate = log_path;
        candidate.replace_extension(extension);
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<SummaryEntry> ResultSummarizer::aggregate(const MetricsLog& log,
                                                        std::string& error_message) {
    if (log.samples.empty()) {
        SummaryEntry entry;
        entry.has_metrics = false;
        return entry;
    }

    ColumnStats cpu, mem, disk;
    for (const auto& sample : log.samples) {
        cpu.add(sample.cpu_percent);
        mem.add(sample.mem_used_mb);
        disk.add(sample.disk_write_kbps);
    }

    if (cpu.count == 0 || mem.count == 0 || disk.count == 0) {
        error_message = "a metrics column holds no values";
        return std::nullopt;
    }

    SummaryEntry entry;
    entry.avg_cpu_percent = roundTo(cpu.mean(), 1);
    entry.max_mem_mb = mem.max;
    entry.avg_disk_kbps = roundTo(disk.mean(), 1);
    return entry;
}

std::optional<SummaryEntry> ResultSummarizer::summarizeLog(const std::filesystem::path& log_path,
                                                           std::string& error_message) {
    auto log = MetricsLogReader::readFile(log_path.string(), error_message);
    if (!log) {
        return std::nullopt;
    }

    auto entry = aggregate(*log, error_message);
    if (!entry) {
        return std::nullopt;
    }

    entry->test = log_path.stem().string();

    if (auto media = findMediaFile(log_path)) {
        std::error_code ec;
        uintmax_t size = std::filesystem::file_size(*media, ec);
        if (!ec) {
            entry->video_size_mb = roundTo(static_cast<double>(size) / (1024.0 * 1024.0), 2);
        }
        entry->video_path = media->string();
    }

    return entry;
}

SummaryReport ResultSummarizer::summarize() const {
    SummaryReport report;

    auto logs = findLogFiles(results_dir_);
    report.log_count = logs.size();

    for (const auto& log_path : logs) {
        std::string error;
        auto entry = summarizeLog(log_path, error);
        if (!entry) {
            report.errors.push_back({log_path.string(), error});
            Logger::warn("Excluded " + log_path.string() + ": " + error);
            continue;
        }
        report.entries.push_back(std::move(*entry));
    }

    std::stable_sort(report.entries.begin(), report.entries.end(),
                     [](const SummaryEntry& a, const SummaryEntry& b) {
                         if (a.has_metrics != b.has_metrics) {
                             return a.has_metrics;
                         }
                         return a.avg_cpu_percent < b.avg_cpu_percent;
                     });

    Logger::info("Summarized " + std::to_string(report.entries.size()) + " of " +
                 std::to_string(report.log_count) + " logs in " + results_dir_);
    return report;
}

} // namespace capture_bench
