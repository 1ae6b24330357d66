// File: reporting/report_writer.hpp

#ifndef REPORTING_REPORT_WRITER_HPP
#define REPORTING_REPORT_WRITER_HPP

#include <filesystem>
#include <string>

#include "types/run_report.hpp"

namespace reporting {

    class ReportWriter {
    public:
        explicit ReportWriter(std::string report_filename = "report.md", std::string summary_filename = "summary.json");

        // Names from "output.report" and "output.summary".
        [[nodiscard]] static ReportWriter fromConfiguration();

        // Writes the Markdown report and the JSON summary into `directory` and returns the report path.
        std::filesystem::path write(const types::RunReport &report, const std::filesystem::path &directory) const;

    private:
        std::string report_filename_;
        std::string summary_filename_;
    };

} // namespace reporting

#endif // REPORTING_REPORT_WRITER_HPP
