#ifndef RESULT_SUMMARIZER_HPP
#define RESULT_SUMMARIZER_HPP

#include "summary/metrics_log.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace capture_bench {

// One row of the summary table
struct SummaryEntry {
    std::string test;             // log file name without ".log"
    double avg_cpu_percent = 0.0; // rounded to 0.1
    double max_mem_mb = 0.0;
    double avg_disk_kbps = 0.0;   // rounded to 0.1
    double video_size_mb = 0.0;   // rounded to 0.01
    std::string video_path;       // empty when no media file was found

    // False for a log holding only its header (the job ended before the
    // first sample); the metric fields are then meaningless
    bool has_metrics = true;
};

// A log that could not be summarized
struct SummaryError {
    std::string log_path;
    std::string message;
};

struct SummaryReport {
    size_t log_count = 0;
    std::vector<SummaryEntry> entries;   // ascending by avg_cpu_percent, rows without metrics last
    std::vector<SummaryError> errors;
};

class ResultSummarizer {
public:
    explicit ResultSummarizer(std::string results_dir);

    // Summarize every metrics log of the results directory
    SummaryReport summarize() const;

    // "*.log" files except "*.error.log", sorted by name
    static std::vector<std::filesystem::path> findLogFiles(const std::filesystem::path& dir);

    // Media file belonging to a log (".mp4" first, then ".avi"), if present
    static std::optional<std::filesystem::path> findMediaFile(const std::filesystem::path& log_path);

    static std::optional<SummaryEntry> summarizeLog(const std::filesystem::path& log_path,
                                                    std::string& error_message);

    // Aggregate parsed samples. A log without samples yields an entry
    // without metrics; fails when some samples exist but a column holds
    // no values.
    static std::optional<SummaryEntry> aggregate(const MetricsLog& log,
                                                 std::string& error_message);

private:
    std::string results_dir_;
};

} // namespace capture_bench

#endif // RESULT_SUMMARIZER_HPP
