#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include "matrix/capture_config.hpp"
#include "monitor/metrics_sampler.hpp"
#include "record/recorder.hpp"
#include "utils/cli_parser.hpp"
#include <istream>

namespace capture_bench {

// One entry point per subcommand. Each returns the process exit code.
class Commands {
public:
    // Exit 1 when ffmpeg is missing or no capture device is found. Per-job
    // failures do not change the exit code.
    static int runMatrix(CaptureConfig config);

    // Exit 1 when the results directory holds no logs
    static int runSummarize(const SummarizeOptions& options);

    static int runDiagnose();

    static int runSample(const SamplerOptions& options);

    // Device choice is read from input when the options carry none
    static int runRecord(const RecordOptions& options, std::istream& input);

private:
    Commands() = delete;

    static bool reportMissingFfmpeg(const std::string& ffmpeg_path);
};

} // namespace capture_bench

#endif // COMMANDS_HPP
