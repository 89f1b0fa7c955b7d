#ifndef CSV_EXPORTER_HPP
#define CSV_EXPORTER_HPP

#include "summary/result_summarizer.hpp"
#include <string>
#include <vector>

namespace capture_bench {

class CsvExporter {
public:
    static bool exportToFile(const std::vector<SummaryEntry>& entries,
                             const std::string& path,
                             std::string& error);
};

} // namespace capture_bench

#endif // CSV_EXPORTER_HPP
