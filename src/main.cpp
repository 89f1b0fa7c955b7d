#include "app/commands.hpp"
#include "utils/cli_parser.hpp"
#include "utils/output_formatter.hpp"
#include "utils/logger.hpp"
#include <iostream>

using namespace capture_bench;

int main(int argc, char* argv[]) {
    // Parse command line arguments first to get log file path
    auto parse_result = CliParser::parse(argc, argv);

    // The sampler runs once per job and must not touch the shared log
    if (parse_result.success && parse_result.command == Command::Sample &&
        !parse_result.show_help && !parse_result.show_version) {
        return Commands::runSample(parse_result.sample);
    }

    struct LoggerShutdownGuard {
        ~LoggerShutdownGuard() {
            Logger::shutdown();
        }
    } logger_shutdown_guard;
    (void)logger_shutdown_guard;

    const std::string log_file_path = parse_result.log_file.value_or(
        Logger::defaultLogFilePath());
    std::string logger_error;
    if (!Logger::initialize(log_file_path, logger_error)) {
        std::cerr << "Warning: Failed to initialize log file '" << log_file_path
                  << "': " << logger_error << "\n";
    } else {
        Logger::info("Log file: " + log_file_path);
        std::string cmdline;
        for (int i = 0; i < argc; i++) {
            if (i > 0) cmdline += ' ';
            cmdline += argv[i];
        }
        Logger::info("Command: " + cmdline);
    }

    if (!parse_result.success) {
        OutputFormatter::printError(parse_result.error_message);
        std::string help_hint = "Try '" + std::string(argv[0]) + " --help' for more information.";
        std::cerr << help_hint << "\n";
        Logger::error(help_hint);
        return 1;
    }

    if (parse_result.show_help) {
        CliParser::printUsage(argv[0]);
        return 0;
    }

    if (parse_result.show_version) {
        CliParser::printVersion();
        return 0;
    }

    switch (parse_result.command) {
        case Command::Summarize:
            return Commands::runSummarize(parse_result.summarize);
        case Command::Diagnose:
            return Commands::runDiagnose();
        case Command::Sample:
            return Commands::runSample(parse_result.sample);
        case Command::Record:
            return Commands::runRecord(parse_result.record, std::cin);
        case Command::Run:
        default:
            return Commands::runMatrix(parse_result.config);
    }
}
