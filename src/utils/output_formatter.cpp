#include "utils/output_formatter.hpp"
#include "summary/report_writer.hpp"
#include "utils/logger.hpp"
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {

std::mutex g_console_mutex;

const std::string kRule = "=========================================";

void printInfoLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cout << line << "\n" << std::flush;
    capture_bench::Logger::info(line);
}

} // namespace

namespace capture_bench {

void OutputFormatter::printLine(const std::string& line) {
    printInfoLine(line);
}

void OutputFormatter::printBlankLine() {
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cout << "\n";
}

std::string OutputFormatter::formatSize(uintmax_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
    return oss.str();
}

void OutputFormatter::printDeviceFound(const CaptureDevice& device) {
    printInfoLine("Found working capture device: " + device.path + " - " + device.card +
                  " (formats: " + device.getFourccList() + ")");
}

void OutputFormatter::printDeviceExcluded(const DeviceEnumerator::Exclusion& exclusion) {
    printInfoLine("Skipping " + exclusion.path + ": " + exclusion.reason);
}

void OutputFormatter::printNoDevices() {
    printError("No HDMI capture devices found!");
    std::cerr << "Please check:\n"
              << "1. HDMI capture device is connected and powered\n"
              << "2. Device drivers are loaded (try: lsusb | grep -i video)\n"
              << "3. User has permissions: sudo usermod -a -G video $USER\n"
              << "\n"
              << "To debug, try: hdmi-capture-bench diagnose\n";
}

void OutputFormatter::printDeviceHeader(const CaptureDevice& device, std::optional<bool> probe_ok) {
    printBlankLine();
    printInfoLine(kRule);
    printInfoLine("Testing device: " + device.path + " (" + device.card + ")");
    printInfoLine(kRule);
    printInfoLine("Device supported formats: " + device.getFourccList());

    if (probe_ok) {
        if (*probe_ok) {
            printInfoLine("  \xE2\x9C\x85 Device is providing video data");
        } else {
            printInfoLine("  \xE2\x9A\xA0\xEF\xB8\x8F  Device may not be connected or providing video data, "
                          "but continuing tests...");
        }
    }
}

void OutputFormatter::printFormatNote(const FormatNote& note) {
    printInfoLine("  Skipping " + note.fourcc + " on " + note.device_path + ": " + note.reason);
}

void OutputFormatter::printJobStart(const CaptureJob& job, int index) {
    std::ostringstream line;
    line << "    [" << index << "] Testing " << job.describe() << " on " << job.device_name << "...";
    printInfoLine(line.str());
}

void OutputFormatter::printJobResult(const JobOutcome& outcome) {
    std::ostringstream line;
    line << "    " << outcome.getStatusSymbol() << " ";

    switch (outcome.state) {
        case JobState::Succeeded:
            line << "SUCCESS: " << outcome.output_path << " created ("
                 << formatSize(outcome.output_size_bytes);
            if (outcome.media) {
                line << ", " << outcome.media->describe();
            }
            line << ")";
            printInfoLine(line.str());
            break;

        case JobState::Skipped:
            line << "Skipping " << outcome.job.device_name << " " << outcome.job.describe()
                 << " (" << outcome.skip_reason << ")";
            printInfoLine(line.str());
            break;

        case JobState::Failed: {
            line << "FAILED: " << outcome.failure_reason << ". Check "
                 << outcome.error_log_path << " for details";
            std::lock_guard<std::mutex> lock(g_console_mutex);
            std::cout << line.str() << "\n";
            Logger::error(line.str());
            if (!outcome.error_preview.empty()) {
                std::cout << "    Error preview:\n";
                for (const auto& preview : outcome.error_preview) {
                    std::cout << "      " << preview << "\n";
                }
            }
            std::cout << std::flush;
            break;
        }

        default:
            break;
    }
}

void OutputFormatter::printTally(const RunSummary& tally) {
    printInfoLine("    Progress: " + std::to_string(tally.attempted) + " attempted, " +
                  std::to_string(tally.succeeded) + " succeeded, " +
                  std::to_string(tally.failed) + " failed");
}

void OutputFormatter::printRunSummary(const RunSummary& summary, const std::string& output_dir) {
    printBlankLine();
    printInfoLine(kRule);
    printInfoLine("TEST RESULTS SUMMARY");
    printInfoLine(kRule);
    printInfoLine("Total tests attempted: " + std::to_string(summary.attempted));
    printInfoLine("Successful captures: " + std::to_string(summary.succeeded));
    printInfoLine("Failed attempts: " + std::to_string(summary.failed));
    printInfoLine("Skipped combinations: " + std::to_string(summary.skipped));

    auto rate = summary.successRatePercent();
    if (rate) {
        printInfoLine("Success rate: " + std::to_string(*rate) + "%");
    } else {
        printInfoLine("Success rate: N/A (no tests run)");
    }
    printInfoLine(kRule);
    printBlankLine();

    printInfoLine("Results saved to: " + output_dir);
    if (summary.succeeded > 0) {
        printInfoLine("Run 'hdmi-capture-bench summarize' for detailed analysis.");
    } else {
        printInfoLine("No successful captures. Check device connections and permissions.");
    }
}

void OutputFormatter::printSummaryReport(const SummaryReport& report) {
    for (const auto& error : report.errors) {
        printInfoLine("Error processing " + error.log_path + ": " + error.message);
    }

    std::string table = ReportWriter::renderText(report.entries);

    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cout << table << std::flush;
    Logger::info("Summary table:\n" + table);
}

void OutputFormatter::printError(const std::string& message) {
    const std::string line = "Error: " + message;
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cerr << line << "\n";
    Logger::error(line);
}

} // namespace capture_bench
