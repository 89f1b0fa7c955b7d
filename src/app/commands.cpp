#include "app/commands.hpp"
#include "device/device_enumerator.hpp"
#include "diagnose/diagnostics.hpp"
#include "matrix/matrix_runner.hpp"
#include "monitor/system_info.hpp"
#include "summary/report_writer.hpp"
#include "summary/result_summarizer.hpp"
#include "utils/csv_exporter.hpp"
#include "utils/logger.hpp"
#include "utils/output_formatter.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace capture_bench {

bool Commands::reportMissingFfmpeg(const std::string& ffmpeg_path) {
    CaptureConfig config;
    config.ffmpeg_path = ffmpeg_path;
    auto missing = MatrixRunner::missingDependencies(config);
    if (missing.empty()) {
        return false;
    }
    for (const auto& program : missing) {
        OutputFormatter::printError(program + " is not installed or not executable");
    }
    std::cerr << "Install with: sudo apt install ffmpeg\n";
    return true;
}

int Commands::runSample(const SamplerOptions& options) {
    std::string error;
    if (!MetricsSampler::create()->run(options, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    return 0;
}

int Commands::runDiagnose() {
    Diagnostics().run();
    return 0;
}

int Commands::runMatrix(CaptureConfig config) {
    if (reportMissingFfmpeg(config.ffmpeg_path)) {
        return 1;
    }

    OutputFormatter::printLine("Scanning for capture devices...");
    DeviceEnumerator::Result discovery = DeviceEnumerator::enumerate(config.dev_dir);
    for (const auto& exclusion : discovery.excluded) {
        OutputFormatter::printDeviceExcluded(exclusion);
    }
    for (const auto& device : discovery.devices) {
        OutputFormatter::printDeviceFound(device);
    }

    if (discovery.devices.empty()) {
        OutputFormatter::printNoDevices();
        return 1;
    }

    // The sampler is this binary's "sample" subcommand
    if (config.sampler_executable.empty()) {
        std::error_code ec;
        auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (!ec) {
            config.sampler_executable = self.string();
        }
    }

    OutputFormatter::printBlankLine();
    OutputFormatter::printLine("Starting capture tests (" + config.getResolutionString() + " @ " +
                               std::to_string(config.fps) + " fps, " +
                               std::to_string(config.duration_seconds) + "s per test)");
    OutputFormatter::printLine("Host: " + SystemInfo::getCpuName() + ", " +
                               SystemInfo::getOsName());

    MatrixRunner runner(config);

    RunObserver observer;
    observer.on_device = [](const CaptureDevice& device, std::optional<bool> probe_ok) {
        OutputFormatter::printDeviceHeader(device, probe_ok);
    };
    observer.on_format_note = [](const FormatNote& note) {
        OutputFormatter::printFormatNote(note);
    };
    observer.on_job_start = [](const CaptureJob& job, int index) {
        OutputFormatter::printJobStart(job, index);
    };
    observer.on_job_finished = [](const JobOutcome& outcome, const RunSummary& tally) {
        OutputFormatter::printJobResult(outcome);
        if (outcome.state != JobState::Skipped) {
            OutputFormatter::printTally(tally);
        }
    };

    RunSummary summary = runner.run(discovery.devices, observer);
    OutputFormatter::printRunSummary(summary, config.output_dir);

    return 0;
}

int Commands::runSummarize(const SummarizeOptions& options) {
    ResultSummarizer summarizer(options.results_dir);
    SummaryReport report = summarizer.summarize();

    if (report.log_count == 0) {
        OutputFormatter::printLine("No log files found in results directory.");
        return 1;
    }

    if (report.entries.empty()) {
        for (const auto& error : report.errors) {
            OutputFormatter::printLine("Error processing " + error.log_path + ": " + error.message);
        }
        OutputFormatter::printLine("No valid data found in log files.");
        return 0;
    }

    OutputFormatter::printSummaryReport(report);

    if (options.html) {
        const std::string html_path = ReportWriter::defaultHtmlPath(options.results_dir);
        std::string html_error;
        if (!ReportWriter::writeHtmlFile(report.entries, html_path, html_error)) {
            OutputFormatter::printError(html_error);
            return 1;
        }
        OutputFormatter::printLine("HTML report written to: " + html_path);
    }

    if (options.csv_file) {
        std::string csv_error;
        if (!CsvExporter::exportToFile(report.entries, *options.csv_file, csv_error)) {
            OutputFormatter::printError(csv_error);
            return 1;
        }
        Logger::info("CSV results exported to: " + *options.csv_file);
    }

    return 0;
}

int Commands::runRecord(const RecordOptions& options, std::istream& input) {
    if (reportMissingFfmpeg(options.ffmpeg_path)) {
        return 1;
    }

    OutputFormatter::printLine("Scanning for video capture devices...");
    DeviceEnumerator::Result discovery = DeviceEnumerator::enumerate(options.dev_dir);
    for (const auto& exclusion : discovery.excluded) {
        Logger::info("Skipping " + exclusion.path + ": " + exclusion.reason);
    }

    if (discovery.devices.empty()) {
        OutputFormatter::printError("No HDMI-to-USB capture devices found.");
        return 1;
    }

    OutputFormatter::printLine("Available HDMI-to-USB capture devices:");
    for (size_t i = 0; i < discovery.devices.size(); i++) {
        OutputFormatter::printLine(Recorder::formatDeviceLine(i, discovery.devices[i]));
    }

    if (!options.device_index) {
        std::cout << "Select device index to record from: " << std::flush;
    }

    std::string error;
    auto choice = Recorder::chooseDevice(discovery.devices.size(), options.device_index,
                                         input, error);
    if (!choice) {
        OutputFormatter::printError(error);
        return 1;
    }

    const CaptureDevice& device = discovery.devices[*choice];
    Recorder recorder(options);
    const std::string output_path = recorder.outputPath(std::chrono::system_clock::now());

    OutputFormatter::printLine("Recording from " + device.path + " to " + output_path);
    if (!recorder.record(device, output_path, error)) {
        OutputFormatter::printError(error);
        return 1;
    }

    OutputFormatter::printLine("Recording saved to: " + output_path);
    return 0;
}

} // namespace capture_bench
