#include "summary/report_writer.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace capture_bench {

namespace {

constexpr const char* kReportTitle = "Raspberry Pi Video Capture Test Summary";
constexpr const char* kHtmlFileName = "summary_report.html";

std::string formatFixed(double value, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

// Whole numbers print without decimals (memory figures are integral MB)
std::string formatMemory(double value) {
    return formatFixed(value, value == std::floor(value) ? 0 : 1);
}

// Metric cells of a log without samples
constexpr const char* kMissingValue = "NaN";

std::vector<std::string> formatRow(const SummaryEntry& entry) {
    if (!entry.has_metrics) {
        return {entry.test, kMissingValue, kMissingValue, kMissingValue,
                formatFixed(entry.video_size_mb, 2)};
    }
    return {
        entry.test,
        formatFixed(entry.avg_cpu_percent, 1),
        formatMemory(entry.max_mem_mb),
        formatFixed(entry.avg_disk_kbps, 1),
        formatFixed(entry.video_size_mb, 2),
    };
}

std::string escapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace

std::string ReportWriter::renderText(const std::vector<SummaryEntry>& entries) {
    const std::vector<std::string> header = {
        "test", "avg_cpu_percent", "max_mem_mb", "avg_disk_kbps", "video_size_mb"};

    std::vector<std::vector<std::string>> rows;
    rows.reserve(entries.size());
    for (const auto& entry : entries) {
        rows.push_back(formatRow(entry));
    }

    std::vector<size_t> widths(header.size());
    for (size_t col = 0; col < header.size(); col++) {
        widths[col] = header[col].size();
        for (const auto& row : rows) {
            widths[col] = std::max(widths[col], row[col].size());
        }
    }

    std::ostringstream out;
    auto writeLine = [&](const std::vector<std::string>& cells) {
        for (size_t col = 0; col < cells.size(); col++) {
            if (col > 0) out << "  ";
            out << std::setw(static_cast<int>(widths[col])) << cells[col];
        }
        out << "\n";
    };

    writeLine(header);
    for (const auto& row : rows) {
        writeLine(row);
    }
    return out.str();
}

std::string ReportWriter::renderHtml(const std::vector<SummaryEntry>& entries) {
    std::ostringstream html;
    html << "<html>\n"
         << "<head>\n"
         << "    <title>" << kReportTitle << "</title>\n"
         << "    <link href=\"https://cdn.jsdelivr.net/npm/bootstrap@5.3.0/dist/css/bootstrap.min.css\" rel=\"stylesheet\">\n"
         << "    <style>\n"
         << "        body { padding: 2rem; font-family: sans-serif; }\n"
         << "        h1 { margin-bottom: 2rem; }\n"
         << "        .table { width: auto; margin: auto; }\n"
         << "    </style>\n"
         << "</head>\n"
         << "<body>\n"
         << "    <h1>" << kReportTitle << "</h1>\n"
         << "    <table class=\"table table-striped\">\n"
         << "        <thead>\n"
         << "            <tr><th>Test</th><th>Avg CPU (%)</th><th>Max RAM (MB)</th>"
            "<th>Avg Disk Write (KB/s)</th><th>Video Size (MB)</th></tr>\n"
         << "        </thead>\n"
         << "        <tbody>\n";

    for (const auto& entry : entries) {
        auto cells = formatRow(entry);
        html << "            <tr>";
        for (const auto& cell : cells) {
            html << "<td>" << escapeHtml(cell) << "</td>";
        }
        html << "</tr>\n";
    }

    html << "        </tbody>\n"
         << "    </table>\n"
         << "</body>\n"
         << "</html>\n";
    return html.str();
}

bool ReportWriter::writeHtmlFile(const std::vector<SummaryEntry>& entries,
                                 const std::string& path,
                                 std::string& error) {
    std::ofstream file(path);
    if (!file.is_open()) {
        error = "Failed to open HTML report: " + path;
        return false;
    }

    file << renderHtml(entries);

    if (!file.good()) {
        error = "Failed to write HTML report: " + path;
        return false;
    }
    return true;
}

std::string ReportWriter::defaultHtmlPath(const std::string& results_dir) {
    return (std::filesystem::path(results_dir) / kHtmlFileName).string();
}

} // namespace capture_bench
