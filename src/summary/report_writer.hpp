#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include "summary/result_summarizer.hpp"
#include <string>
#include <vector>

namespace capture_bench {

class ReportWriter {
public:
    // Right-aligned plain text table, one row per entry
    static std::string renderText(const std::vector<SummaryEntry>& entries);

    // Standalone HTML page with the summary table
    static std::string renderHtml(const std::vector<SummaryEntry>& entries);

    static bool writeHtmlFile(const std::vector<SummaryEntry>& entries,
                              const std::string& path,
                              std::string& error);

    // "summary_report.html" inside the results directory
    static std::string defaultHtmlPath(const std::string& results_dir);

private:
    ReportWriter() = delete;
};

} // namespace capture_bench

#endif // REPORT_WRITER_HPP
