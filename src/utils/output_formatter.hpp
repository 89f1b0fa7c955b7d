#ifndef OUTPUT_FORMATTER_HPP
#define OUTPUT_FORMATTER_HPP

#include "device/device_enumerator.hpp"
#include "matrix/job_result.hpp"
#include "matrix/matrix_runner.hpp"
#include "summary/result_summarizer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace capture_bench {

// Console output of all subcommands. Every line is mirrored to the log file
// and lines from concurrent jobs are never interleaved.
class OutputFormatter {
public:
    static void printLine(const std::string& line);
    static void printBlankLine();

    // Device discovery
    static void printDeviceFound(const CaptureDevice& device);
    static void printDeviceExcluded(const DeviceEnumerator::Exclusion& exclusion);
    static void printNoDevices();

    // "=== Testing device: /dev/video0 (Cam Link 4K) ===" plus formats
    static void printDeviceHeader(const CaptureDevice& device, std::optional<bool> probe_ok);
    static void printFormatNote(const FormatNote& note);

    // "[3] Testing yuyv -> libx264 (mp4) on video0..."
    static void printJobStart(const CaptureJob& job, int index);
    static void printJobResult(const JobOutcome& outcome);

    // "    Progress: 3 attempted, 2 succeeded, 1 failed"
    static void printTally(const RunSummary& tally);

    // Totals and success rate of a matrix run
    static void printRunSummary(const RunSummary& summary, const std::string& output_dir);

    // Parse errors followed by the summary table
    static void printSummaryReport(const SummaryReport& report);

    // Print an error message
    static void printError(const std::string& message);

    // "12.3 MB"
    static std::string formatSize(uintmax_t bytes);
};

} // namespace capture_bench

#endif // OUTPUT_FORMATTER_HPP
