#ifndef JOB_RESULT_HPP
#define JOB_RESULT_HPP

#include "matrix/capture_job.hpp"
#include "media/media_info.hpp"
#include "process/subprocess.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace capture_bench {

// Final state of one job of the matrix
struct JobOutcome {
    CaptureJob job;
    JobState state = JobState::Pending;
    int index = 0;                   // attempt number, 0 for skipped jobs

    std::string skip_reason;
    std::string failure_reason;
    ExitStatus capture_status;

    std::string output_path;
    std::string log_path;
    std::string error_log_path;      // kept only when the job failed
    uintmax_t output_size_bytes = 0;
    std::optional<MediaInfo> media;  // probe of the output, when readable

    // First lines of the error log, for the console
    std::vector<std::string> error_preview;

    bool succeeded() const { return state == JobState::Succeeded; }

    std::string getStatusSymbol() const {
        switch (state) {
            case JobState::Succeeded:
                return "\xE2\x9C\x85";  // UTF-8 for ✅
            case JobState::Failed:
                return "\xE2\x9D\x8C";  // UTF-8 for ❌
            case JobState::Skipped:
                return "\xE2\x8F\xAD\xEF\xB8\x8F";  // UTF-8 for ⏭️
            default:
                return "";
        }
    }
};

// Overall result of one matrix run
struct RunSummary {
    std::vector<JobOutcome> outcomes;

    int attempted = 0;
    int succeeded = 0;
    int failed = 0;
    int skipped = 0;

    // Integer success rate, nullopt when no job ran
    std::optional<int> successRatePercent() const {
        if (attempted == 0) {
            return std::nullopt;
        }
        return succeeded * 100 / attempted;
    }
};

} // namespace capture_bench

#endif // JOB_RESULT_HPP
