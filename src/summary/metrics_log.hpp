#ifndef METRICS_LOG_HPP
#define METRICS_LOG_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace capture_bench {

// One row of a per-job metrics log. Empty or missing cells stay unset.
struct MetricsSample {
    std::optional<double> timestamp;
    std::optional<double> cpu_percent;
    std::optional<double> mem_used_mb;
    std::optional<double> disk_write_kbps;
};

struct MetricsLog {
    std::vector<MetricsSample> samples;
};

// Reads the CSV written by the metrics sampler. Columns are located by
// header name, so extra or reordered columns are accepted.
class MetricsLogReader {
public:
    static std::optional<MetricsLog> readFile(const std::string& path,
                                              std::string& error_message);

    static std::optional<MetricsLog> parse(std::istream& in,
                                           std::string& error_message);

private:
    MetricsLogReader() = delete;
};

} // namespace capture_bench

#endif // METRICS_LOG_HPP
