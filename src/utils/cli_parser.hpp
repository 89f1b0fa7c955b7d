#ifndef CLI_PARSER_HPP
#define CLI_PARSER_HPP

#include "matrix/capture_config.hpp"
#include "monitor/metrics_sampler.hpp"
#include "record/recorder.hpp"
#include <string>
#include <optional>
#include <vector>

namespace capture_bench {

enum class Command {
    Run,
    Summarize,
    Diagnose,
    Sample,
    Record
};

struct SummarizeOptions {
    std::string results_dir = "./results";

    // Also write summary_report.html into the results directory
    bool html = false;

    // Optional: export the summary table as CSV
    std::optional<std::string> csv_file;
};

struct CliParseResult {
    bool success;
    bool show_help;
    bool show_version;
    Command command;
    CaptureConfig config;
    SummarizeOptions summarize;
    SamplerOptions sample;
    RecordOptions record;

    // Optional: log file path (default: hdmi-capture-bench.log)
    std::optional<std::string> log_file;

    std::string error_message;
};

class CliParser {
public:
    static CliParseResult parse(int argc, char* argv[]);

    static void printUsage(const std::string& program_name);
    static void printVersion();

private:
    static std::optional<int> parseInteger(const std::string& str);

    // "1920x1080"
    static bool parseResolution(const std::string& str, int& width, int& height);

    // Comma-separated names, each accepted by from_name
    template <typename T, typename FromName>
    static std::optional<std::vector<T>> parseList(const std::string& str, FromName from_name);
};

} // namespace capture_bench

#endif // CLI_PARSER_HPP
