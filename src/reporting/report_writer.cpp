// File: reporting/report_writer.cpp

#include "reporting/report_writer.hpp"

#include <utility>

#include "common/io/io.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "reporting/report_builder.hpp"

namespace reporting {

    ReportWriter::ReportWriter(std::string report_filename, std::string summary_filename) :
        report_filename_(std::move(report_filename)), summary_filename_(std::move(summary_filename)) {}

    ReportWriter ReportWriter::fromConfiguration() {
        return ReportWriter(config::get("output.report", "report.md"), config::get("output.summary", "summary.json"));
    }

    std::filesystem::path ReportWriter::write(const types::RunReport &report,
                                              const std::filesystem::path &directory) const {
        common::io::createDirectory(directory);

        const auto report_path = directory / report_filename_;
        common::io::writeTextFile(report_path, ReportBuilder::render(report));
        LOG_INFO("Report written to {}", report_path.string());

        if (!summary_filename_.empty()) {
            const auto summary_path = directory / summary_filename_;
            common::io::writeTextFile(summary_path, ReportBuilder::summarize(report).dump(4) + "\n");
            LOG_INFO("Summary written to {}", summary_path.string());
        }

        return report_path;
    }

} // namespace reporting
