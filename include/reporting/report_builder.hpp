// File: reporting/report_builder.hpp

#ifndef REPORTING_REPORT_BUILDER_HPP
#define REPORTING_REPORT_BUILDER_HPP

#include <nlohmann/json.hpp>
#include <string>

#include "types/run_report.hpp"

namespace reporting {

    using json = nlohmann::json;

    // Pure text assembly; nothing here touches the filesystem.
    class ReportBuilder {
    public:
        // Markdown report: header, one section per compared pair, skipped and unmatched keys, recommendation.
        [[nodiscard]] static std::string render(const types::RunReport &report);

        // Machine-readable summary of the same run.
        [[nodiscard]] static json summarize(const types::RunReport &report);

        // "rms: 12.34" plus the size mismatch note when the pair had to be padded.
        [[nodiscard]] static std::string formatScore(const types::RunReport &report, const types::DiffResult &result);
    };

} // namespace reporting

#endif // REPORTING_REPORT_BUILDER_HPP
