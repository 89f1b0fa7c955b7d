#include "utils/csv_exporter.hpp"
#include <fstream>

namespace capture_bench {

bool CsvExporter::exportToFile(const std::vector<SummaryEntry>& entries,
                               const std::string& path,
                               std::string& error) {
    std::ofstream file(path);
    if (!file.is_open()) {
        error = "Failed to open CSV file: " + path;
        return false;
    }

    file << "test,avg_cpu_percent,max_mem_mb,avg_disk_kbps,video_size_mb\n";

    for (const auto& entry : entries) {
        file << entry.test << ",";
        if (entry.has_metrics) {
            file << entry.avg_cpu_percent << ","
                 << entry.max_mem_mb << ","
                 << entry.avg_disk_kbps << ",";
        } else {
            file << ",,,";
        }
        file << entry.video_size_mb << "\n";
    }

    if (!file.good()) {
        error = "Failed to write CSV file: " + path;
        return false;
    }

    return true;
}

} // namespace capture_bench
