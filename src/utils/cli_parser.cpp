#include "utils/cli_parser.hpp"
#include "capture_bench/version.hpp"
#include <iostream>
#include <charconv>
#include <sstream>

namespace capture_bench {

std::optional<int> CliParser::parseInteger(const std::string& str) {
    int value;
    auto result = std::from_chars(str.data(), str.data() + str.size(), value);
    if (result.ec == std::errc() && result.ptr == str.data() + str.size()) {
        return value;
    }
    return std::nullopt;
}

bool CliParser::parseResolution(const std::string& str, int& width, int& height) {
    size_t x = str.find('x');
    if (x == std::string::npos) {
        return false;
    }
    auto w = parseInteger(str.substr(0, x));
    auto h = parseInteger(str.substr(x + 1));
    if (!w || !h || *w <= 0 || *h <= 0) {
        return false;
    }
    width = *w;
    height = *h;
    return true;
}

template <typename T, typename FromName>
std::optional<std::vector<T>> CliParser::parseList(const std::string& str, FromName from_name) {
    std::vector<T> values;
    std::istringstream iss(str);
    std::string item;
    while (std::getline(iss, item, ',')) {
        auto value = from_name(item);
        if (!value) {
            return std::nullopt;
        }
        values.push_back(*value);
    }
    if (values.empty()) {
        return std::nullopt;
    }
    return values;
}

CliParseResult CliParser::parse(int argc, char* argv[]) {
    CliParseResult result;
    result.success = true;
    result.show_help = false;
    result.show_version = false;
    result.command = Command::Run;

    std::vector<std::string> args(argv, argv + argc);
    size_t first = 1;

    if (args.size() > 1) {
        const std::string& name = args[1];
        if (name == "run") {
            first = 2;
        } else if (name == "summarize") {
            result.command = Command::Summarize;
            first = 2;
        } else if (name == "diagnose") {
            result.command = Command::Diagnose;
            first = 2;
        } else if (name == "sample") {
            result.command = Command::Sample;
            first = 2;
        } else if (name == "record") {
            result.command = Command::Record;
            first = 2;
        }
    }

    bool sample_duration_set = false;

    auto fail = [&result](const std::string& message) {
        result.success = false;
        result.error_message = message;
        return result;
    };

    for (size_t i = first; i < args.size(); i++) {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();

        if (arg == "-h" || arg == "--help") {
            result.show_help = true;
            return result;
        }

        if (arg == "-v" || arg == "--version") {
            result.show_version = true;
            return result;
        }

        if (arg == "--log-file" || arg == "-l") {
            if (!has_value) return fail("Missing value for --log-file");
            result.log_file = args[++i];
            continue;
        }

        if (result.command == Command::Run) {
            if (arg == "--duration" || arg == "-d") {
                if (!has_value) return fail("Missing value for --duration");
                auto value = parseInteger(args[++i]);
                if (!value || *value <= 0) {
                    return fail("Invalid value for --duration: must be a positive integer");
                }
                result.config.duration_seconds = *value;
                continue;
            }

            if (arg == "--resolution" || arg == "-r") {
                if (!has_value) return fail("Missing value for --resolution");
                if (!parseResolution(args[++i], result.config.width, result.config.height)) {
                    return fail("Invalid value for --resolution: expected WIDTHxHEIGHT");
                }
                continue;
            }

            if (arg == "--fps" || arg == "-f") {
                if (!has_value) return fail("Missing value for --fps");
                auto value = parseInteger(args[++i]);
                if (!value || *value <= 0) {
                    return fail("Invalid value for --fps: must be a positive integer");
                }
                result.config.fps = *value;
                continue;
            }

            if (arg == "--output-dir" || arg == "-o") {
                if (!has_value) return fail("Missing value for --output-dir");
                result.config.output_dir = args[++i];
                continue;
            }

            if (arg == "--formats") {
                if (!has_value) return fail("Missing value for --formats");
                auto formats = parseList<PixelFormat>(args[++i], pixelFormatFromName);
                if (!formats) {
                    return fail("Invalid value for --formats: expected a list of mjpeg, yuyv, nv12");
                }
                result.config.formats = *formats;
                continue;
            }

            if (arg == "--encoders") {
                if (!has_value) return fail("Missing value for --encoders");
                auto encoders = parseList<Encoder>(args[++i], encoderFromName);
                if (!encoders) {
                    return fail("Invalid value for --encoders: expected a list of copy, v4l2m2m, libx264");
                }
                result.config.encoders = *encoders;
                continue;
            }

            if (arg == "--parallel" || arg == "-p") {
                result.config.policy.max_concurrent_jobs = 0;
                continue;
            }

            if (arg == "--max-jobs" || arg == "-j") {
                if (!has_value) return fail("Missing value for --max-jobs");
                auto value = parseInteger(args[++i]);
                if (!value || *value <= 0) {
                    return fail("Invalid value for --max-jobs: must be a positive integer");
                }
                result.config.policy.max_concurrent_jobs = *value;
                continue;
            }

            if (arg == "--allow-shared-devices") {
                result.config.policy.exclusive_devices = false;
                continue;
            }

            if (arg == "--no-probe") {
                result.config.probe_connectivity = false;
                continue;
            }

            if (arg == "--ffmpeg") {
                if (!has_value) return fail("Missing value for --ffmpeg");
                result.config.ffmpeg_path = args[++i];
                continue;
            }
        }

        if (result.command == Command::Summarize) {
            if (arg == "--results-dir" || arg == "-o") {
                if (!has_value) return fail("Missing value for --results-dir");
                result.summarize.results_dir = args[++i];
                continue;
            }

            if (arg == "--html") {
                result.summarize.html = true;
                continue;
            }

            if (arg == "--csv-file" || arg == "-c") {
                if (!has_value) return fail("Missing value for --csv-file");
                result.summarize.csv_file = args[++i];
                continue;
            }
        }

        if (result.command == Command::Sample) {
            if (arg == "--duration" || arg == "-d") {
                if (!has_value) return fail("Missing value for --duration");
                auto value = parseInteger(args[++i]);
                if (!value || *value < 0) {
                    return fail("Invalid value for --duration: must be a non-negative integer");
                }
                result.sample.duration_seconds = *value;
                sample_duration_set = true;
                continue;
            }

            if (arg == "--output") {
                if (!has_value) return fail("Missing value for --output");
                result.sample.output_path = args[++i];
                continue;
            }
        }

        if (result.command == Command::Record) {
            if (arg == "--device") {
                if (!has_value) return fail("Missing value for --device");
                auto value = parseInteger(args[++i]);
                if (!value || *value < 0) {
                    return fail("Invalid value for --device: must be a non-negative integer");
                }
                result.record.device_index = *value;
                continue;
            }

            if (arg == "--duration" || arg == "-d") {
                if (!has_value) return fail("Missing value for --duration");
                auto value = parseInteger(args[++i]);
                if (!value || *value <= 0) {
                    return fail("Invalid value for --duration: must be a positive integer");
                }
                result.record.duration_seconds = *value;
                continue;
            }

            if (arg == "--resolution" || arg == "-r") {
                if (!has_value) return fail("Missing value for --resolution");
                if (!parseResolution(args[++i], result.record.width, result.record.height)) {
                    return fail("Invalid value for --resolution: expected WIDTHxHEIGHT");
                }
                continue;
            }

            if (arg == "--fps" || arg == "-f") {
                if (!has_value) return fail("Missing value for --fps");
                auto value = parseInteger(args[++i]);
                if (!value || *value <= 0) {
                    return fail("Invalid value for --fps: must be a positive integer");
                }
                result.record.fps = *value;
                continue;
            }

            if (arg == "--output-dir" || arg == "-o") {
                if (!has_value) return fail("Missing value for --output-dir");
                result.record.output_dir = args[++i];
                continue;
            }

            if (arg == "--ffmpeg") {
                if (!has_value) return fail("Missing value for --ffmpeg");
                result.record.ffmpeg_path = args[++i];
                continue;
            }
        }

        if (!arg.empty() && arg[0] == '-') {
            return fail("Unknown option: " + arg);
        }
        return fail("Unexpected argument: " + arg);
    }

    if (result.command == Command::Sample &&
        (!sample_duration_set || result.sample.output_path.empty())) {
        return fail("sample requires --duration and --output");
    }

    return result;
}

void CliParser::printUsage(const std::string& program_name) {
    std::cout << "Usage: " << program_name << " [run] [OPTIONS]\n"
              << "       " << program_name << " summarize [--results-dir DIR] [--html] [--csv-file PATH]\n"
              << "       " << program_name << " diagnose\n"
              << "       " << program_name << " record [--device N] [OPTIONS]\n"
              << "       " << program_name << " sample --duration SEC --output PATH\n"
              << "\n"
              << "HDMI capture test suite - records every device x format x encoder combination\n"
              << "with ffmpeg while logging CPU, memory and disk usage\n"
              << "\n"
              << "Run options:\n"
              << "  -d, --duration SEC       Seconds to record per test (default: 10)\n"
              << "  -r, --resolution WxH     Capture resolution (default: 1920x1080)\n"
              << "  -f, --fps N              Capture frame rate (default: 30)\n"
              << "  -o, --output-dir DIR     Directory for videos and logs (default: ./results)\n"
              << "      --formats LIST       Pixel formats to test: mjpeg,yuyv,nv12 (default: all)\n"
              << "      --encoders LIST      Encoders to test: copy,v4l2m2m,libx264 (default: all)\n"
              << "  -p, --parallel           Start all tests without waiting for earlier ones\n"
              << "  -j, --max-jobs N         Run at most N tests at once\n"
              << "      --allow-shared-devices  Let parallel tests share a capture device\n"
              << "      --no-probe           Skip the single-frame connectivity check\n"
              << "      --ffmpeg PATH        ffmpeg executable (default: ffmpeg)\n"
              << "\n"
              << "Summarize options:\n"
              << "  -o, --results-dir DIR    Directory holding the test logs (default: ./results)\n"
              << "      --html               Also write summary_report.html into the results directory\n"
              << "  -c, --csv-file PATH      Export the summary table to CSV\n"
              << "\n"
              << "Record options:\n"
              << "      --device N           Index of the listed device (default: ask)\n"
              << "  -d, --duration SEC       Stop after SEC seconds (default: until Ctrl-C)\n"
              << "  -r, --resolution WxH     Capture resolution (default: 1920x1080)\n"
              << "  -f, --fps N              Capture frame rate (default: 30)\n"
              << "  -o, --output-dir DIR     Directory for capture_<timestamp>.mp4 (default: .)\n"
              << "      --ffmpeg PATH        ffmpeg executable (default: ffmpeg)\n"
              << "\n"
              << "Common options:\n"
              << "  -l, --log-file PATH      Log file path (default: hdmi-capture-bench.log)\n"
              << "  -h, --help               Show this help message\n"
              << "  -v, --version            Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << "\n"
              << "  " << program_name << " --parallel --max-jobs 2 --duration 30\n"
              << "  " << program_name << " summarize --html\n"
              << "  " << program_name << " record --device 0\n";
}

void CliParser::printVersion() {
    std::cout << PROGRAM_NAME << " version " << VERSION << "\n";
}

} // namespace capture_bench
