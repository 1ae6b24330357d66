// File: types/run_report.hpp

#ifndef TYPES_RUN_REPORT_HPP
#define TYPES_RUN_REPORT_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core.hpp>

#include "types/screenshot_pair.hpp"
#include "types/verdict.hpp"

namespace types {

    struct DiffResult {
        std::string key;
        double rms{0.0};
        bool size_mismatch{false};
        cv::Size left_size;
        cv::Size right_size;
        std::filesystem::path diff_path;
    };

    struct ComparedPair {
        ScreenshotPair pair;
        DiffResult result;
        Verdict verdict{Verdict::Match};
    };

    // A complete pair that could not be compared (decode or write failure).
    struct SkippedPair {
        ScreenshotPair pair;
        std::string reason;
    };

    // A key captured on one side only.
    struct UnmatchedKey {
        std::string key;
        std::string side;
        std::filesystem::path path;
    };

    enum class Outcome { ScriptsNeedUpdate, ReviewNeeded, AllClear };

    struct FlaggedPair {
        std::string key;
        double rms{0.0};
    };

    struct Recommendation {
        Outcome outcome{Outcome::AllClear};
        std::size_t total{0};
        std::size_t matches{0};
        std::size_t minor_diffs{0};
        std::size_t major_diffs{0};
        std::optional<std::string> divergence_point;
        std::vector<FlaggedPair> flagged;
        std::string headline;
        std::vector<std::string> guidance;
    };

    struct RunReport {
        std::string run_id;
        std::string generated_at;
        std::string left_name;
        std::string right_name;
        std::filesystem::path left_directory;
        std::filesystem::path right_directory;
        std::filesystem::path output_directory;
        Thresholds thresholds;
        std::vector<ComparedPair> compared;
        std::vector<SkippedPair> skipped;
        std::vector<UnmatchedKey> unmatched;
        Recommendation recommendation;
    };

    [[nodiscard]] constexpr std::string_view toString(const Outcome outcome) noexcept {
        switch (outcome) {
            case Outcome::ScriptsNeedUpdate:
                return "scripts_need_update";
            case Outcome::ReviewNeeded:
                return "review_needed";
            case Outcome::AllClear:
                return "all_clear";
        }
        return "unknown";
    }

} // namespace types

#endif // TYPES_RUN_REPORT_HPP
