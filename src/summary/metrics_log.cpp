#include "summary/metrics_log.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <utility>

namespace capture_bench {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t comma = line.find(',', start);
        if (comma == std::string::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

// Unset for empty and NaN cells, false for anything that is not a number
bool parseCell(const std::string& cell, std::optional<double>& value) {
    value.reset();
    if (cell.empty()) {
        return true;
    }

    errno = 0;
    char* end = nullptr;
    double parsed = std::strtod(cell.c_str(), &end);
    if (end != cell.c_str() + cell.size() || errno == ERANGE) {
        return false;
    }
    if (!std::isnan(parsed)) {
        value = parsed;
    }
    return true;
}

struct ColumnMap {
    int timestamp = -1;
    int cpu_percent = -1;
    int mem_used_mb = -1;
    int disk_write_kbps = -1;
};

} // namespace

std::optional<MetricsLog> MetricsLogReader::readFile(const std::string& path,
                                                     std::string& error_message) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error_message = "cannot open file";
        return std::nullopt;
    }
    return parse(file, error_message);
}

std::optional<MetricsLog> MetricsLogReader::parse(std::istream& in,
                                                  std::string& error_message) {
    std::string line;
    size_t line_number = 0;

    // Header is the first non-blank line
    std::vector<std::string> header;
    while (std::getline(in, line)) {
        line_number++;
        if (!trim(line).empty()) {
            header = splitFields(line);
            break;
        }
    }
    if (header.empty()) {
        error_message = "file is empty";
        return std::nullopt;
    }

    ColumnMap columns;
    for (size_t i = 0; i < header.size(); i++) {
        const int index = static_cast<int>(i);
        if (header[i] == "timestamp") {
            columns.timestamp = index;
        } else if (header[i] == "cpu_percent") {
            columns.cpu_percent = index;
        } else if (header[i] == "mem_used_mb") {
            columns.mem_used_mb = index;
        } else if (header[i] == "disk_write_kbps") {
            columns.disk_write_kbps = index;
        }
    }

    const std::pair<const char*, int> required[] = {
        {"cpu_percent", columns.cpu_percent},
        {"mem_used_mb", columns.mem_used_mb},
        {"disk_write_kbps", columns.disk_write_kbps},
    };
    for (const auto& [name, index] : required) {
        if (index < 0) {
            error_message = std::string("missing column '") + name + "'";
            return std::nullopt;
        }
    }

    MetricsLog log;

    while (std::getline(in, line)) {
        line_number++;
        if (trim(line).empty()) {
            continue;
        }

        std::vector<std::string> fields = splitFields(line);
        if (fields.size() > header.size()) {
            error_message = "line " + std::to_string(line_number) + ": expected " +
                            std::to_string(header.size()) + " fields, saw " +
                            std::to_string(fields.size());
            return std::nullopt;
        }

        MetricsSample sample;
        auto cell = [&](int index, std::optional<double>& value) {
            if (index < 0 || static_cast<size_t>(index) >= fields.size()) {
                value.reset();
                return true;
            }
            if (!parseCell(fields[index], value)) {
                error_message = "line " + std::to_string(line_number) +
                                ": non-numeric value '" + fields[index] +
                                "' in column '" + header[index] + "'";
                return false;
            }
            return true;
        };

        if (!cell(columns.timestamp, sample.timestamp) ||
            !cell(columns.cpu_percent, sample.cpu_percent) ||
            !cell(columns.mem_used_mb, sample.mem_used_mb) ||
            !cell(columns.disk_write_kbps, sample.disk_write_kbps)) {
            return std::nullopt;
        }

        log.samples.push_back(sample);
    }

    return log;
}

} // namespace capture_bench
