// File: reporting/report_builder.cpp

#include "reporting/report_builder.hpp"

#include <fmt/format.h>
#include <iterator>

#include "common/formatting/fmt_cv.hpp"

namespace reporting {

    namespace {
        std::string pathOrDash(const std::optional<std::filesystem::path> &path) {
            return path ? path->generic_string() : "-";
        }

        std::string_view flaggedCaption(const types::Outcome outcome) {
            return outcome == types::Outcome::ScriptsNeedUpdate ? "Major differences:" : "Minor differences:";
        }
    } // namespace

    std::string ReportBuilder::formatScore(const types::RunReport &report, const types::DiffResult &result) {
        auto line = fmt::format("rms: {:.2f}", result.rms);
        if (result.size_mismatch) {
            line += fmt::format(" (size mismatch: {} {} vs {} {})", report.left_name, result.left_size,
                                report.right_name, result.right_size);
        }
        return line;
    }

    std::string ReportBuilder::render(const types::RunReport &report) {
        fmt::memory_buffer out;
        auto it = std::back_inserter(out);

        fmt::format_to(it, "# Screenshot Diff Report\n\n");
        fmt::format_to(it, "- run: {}\n", report.run_id);
        if (!report.generated_at.empty()) {
            fmt::format_to(it, "- generated: {}\n", report.generated_at);
        }
        fmt::format_to(it, "- {}: {}\n", report.left_name, report.left_directory.generic_string());
        fmt::format_to(it, "- {}: {}\n", report.right_name, report.right_directory.generic_string());
        fmt::format_to(it, "- thresholds: match < {:.2f}, review < {:.2f}\n\n", report.thresholds.match,
                       report.thresholds.review);

        for (const auto &entry: report.compared) {
            fmt::format_to(it, "## {}\n\n", entry.result.key);
            fmt::format_to(it, "- verdict: {} ({})\n", entry.verdict, types::describe(entry.verdict));
            fmt::format_to(it, "- {}: {}\n", report.left_name, pathOrDash(entry.pair.left()));
            fmt::format_to(it, "- {}: {}\n", report.right_name, pathOrDash(entry.pair.right()));
            fmt::format_to(it, "- diff: {}\n", entry.result.diff_path.generic_string());
            fmt::format_to(it, "- {}\n\n", formatScore(report, entry.result));
        }

        if (!report.skipped.empty()) {
            fmt::format_to(it, "## Skipped\n\n");
            for (const auto &skipped: report.skipped) {
                fmt::format_to(it, "- {}: {}\n", skipped.pair.key(), skipped.reason);
            }
            fmt::format_to(it, "\n");
        }

        if (!report.unmatched.empty()) {
            fmt::format_to(it, "## Unmatched\n\n");
            for (const auto &unmatched: report.unmatched) {
                fmt::format_to(it, "- {}: only in {} ({})\n", unmatched.key, unmatched.side,
                               unmatched.path.generic_string());
            }
            fmt::format_to(it, "\n");
        }

        const auto &recommendation = report.recommendation;
        fmt::format_to(it, "## Recommendation\n\n");
        fmt::format_to(it, "- compared: {}\n", recommendation.total);
        fmt::format_to(it, "- match: {}\n", recommendation.matches);
        fmt::format_to(it, "- minor diff: {}\n", recommendation.minor_diffs);
        fmt::format_to(it, "- major diff: {}\n", recommendation.major_diffs);
        if (!report.skipped.empty()) {
            fmt::format_to(it, "- skipped: {}\n", report.skipped.size());
        }
        fmt::format_to(it, "\n**{}**\n", recommendation.headline);

        for (const auto &line: recommendation.guidance) {
            fmt::format_to(it, "\n{}\n", line);
        }

        if (!recommendation.flagged.empty()) {
            fmt::format_to(it, "\n{}\n\n", flaggedCaption(recommendation.outcome));
            for (const auto &flagged: recommendation.flagged) {
                fmt::format_to(it, "- `{}`: rms {:.2f}\n", flagged.key, flagged.rms);
            }
        }

        return fmt::to_string(out);
    }

    json ReportBuilder::summarize(const types::RunReport &report) {
        const auto &recommendation = report.recommendation;

        json pairs = json::array();
        for (const auto &entry: report.compared) {
            json row = {{"key", entry.result.key},
                        {"verdict", std::string(types::toString(entry.verdict))},
                        {"rms", entry.result.rms},
                        {report.left_name, pathOrDash(entry.pair.left())},
                        {report.right_name, pathOrDash(entry.pair.right())},
                        {"diff", entry.result.diff_path.generic_string()},
                        {"size_mismatch", entry.result.size_mismatch}};
            if (entry.result.size_mismatch) {
                row["sizes"] = {{report.left_name, fmt::format("{}", entry.result.left_size)},
                                {report.right_name, fmt::format("{}", entry.result.right_size)}};
            }
            pairs.push_back(std::move(row));
        }

        json skipped = json::array();
        for (const auto &entry: report.skipped) {
            skipped.push_back({{"key", entry.pair.key()}, {"reason", entry.reason}});
        }

        json unmatched = json::array();
        for (const auto &entry: report.unmatched) {
            unmatched.push_back({{"key", entry.key}, {"side", entry.side}, {"path", entry.path.generic_string()}});
        }

        json flagged = json::array();
        for (const auto &entry: recommendation.flagged) {
            flagged.push_back({{"key", entry.key}, {"rms", entry.rms}});
        }

        return {{"run", report.run_id},
                {"generated", report.generated_at},
                {"thresholds", {{"match", report.thresholds.match}, {"review", report.thresholds.review}}},
                {"counts",
                 {{"compared", recommendation.total},
                  {"match", recommendation.matches},
                  {"minor_diff", recommendation.minor_diffs},
                  {"major_diff", recommendation.major_diffs},
                  {"skipped", report.skipped.size()},
                  {"unmatched", report.unmatched.size()}}},
                {"outcome", std::string(types::toString(recommendation.outcome))},
                {"headline", recommendation.headline},
                {"divergence_point",
                 recommendation.divergence_point ? json(*recommendation.divergence_point) : json(nullptr)},
                {"flagged", flagged},
                {"pairs", pairs},
                {"skipped", skipped},
                {"unmatched", unmatched}};
    }

} // namespace reporting
