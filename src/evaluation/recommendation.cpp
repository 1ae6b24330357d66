// File: evaluation/recommendation.cpp

#include "evaluation/recommendation.hpp"

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace evaluation {

    namespace {
        std::string plural(const std::size_t count, const std::string_view noun) {
            return fmt::format("{} {}{}", count, noun, count == 1 ? "" : "s");
        }

        std::vector<types::FlaggedPair> collect(const std::vector<types::ComparedPair> &compared,
                                                const types::Verdict verdict) {
            std::vector<types::FlaggedPair> flagged;
            for (const auto &entry: compared) {
                if (entry.verdict == verdict) {
                    flagged.push_back({entry.result.key, entry.result.rms});
                }
            }
            return flagged;
        }
    } // namespace

    types::Recommendation RecommendationSynthesizer::synthesize(const std::vector<types::ComparedPair> &compared) {
        if (compared.empty()) {
            LOG_ERROR("Cannot build a recommendation without compared pairs");
            throw common::ConfigurationError("No screenshot pairs were compared");
        }

        types::Recommendation recommendation;
        recommendation.total = compared.size();
        for (const auto &entry: compared) {
            switch (entry.verdict) {
                case types::Verdict::Match:
                    ++recommendation.matches;
                    break;
                case types::Verdict::MinorDiff:
                    ++recommendation.minor_diffs;
                    break;
                case types::Verdict::MajorDiff:
                    ++recommendation.major_diffs;
                    break;
            }
        }

        if (recommendation.major_diffs > 0) {
            recommendation.outcome = types::Outcome::ScriptsNeedUpdate;
            recommendation.flagged = collect(compared, types::Verdict::MajorDiff);
            recommendation.divergence_point = recommendation.flagged.front().key;
            recommendation.headline =
                    fmt::format("Scripts need update: {} of {} show different content.",
                                plural(recommendation.major_diffs, "screenshot"), recommendation.total);
            recommendation.guidance.push_back(
                    fmt::format("Divergence point: `{}` is the first screen where the scripted run no longer matches "
                                "the exploratory capture. Start updating the scripts from this step.",
                                *recommendation.divergence_point));
            if (recommendation.minor_diffs > 0) {
                recommendation.guidance.push_back(
                        fmt::format("{} also show possible changes; re-check them after the scripts are updated.",
                                    plural(recommendation.minor_diffs, "other screenshot")));
            }
            LOG_WARN("Scripts need update, divergence point '{}'", *recommendation.divergence_point);
        } else if (recommendation.minor_diffs > 0) {
            recommendation.outcome = types::Outcome::ReviewNeeded;
            recommendation.flagged = collect(compared, types::Verdict::MinorDiff);
            recommendation.headline =
                    fmt::format("Review needed: {} of {} show possible changes.",
                                plural(recommendation.minor_diffs, "screenshot"), recommendation.total);
            recommendation.guidance.emplace_back(
                    "A human needs to judge whether each difference is cosmetic (anti-aliasing, font hinting, "
                    "timing) or functional (content, layout, state):");
            LOG_INFO("Review needed for {} screenshot(s)", recommendation.minor_diffs);
        } else {
            recommendation.outcome = types::Outcome::AllClear;
            recommendation.headline =
                    fmt::format("All clear: all {} match within rendering noise.",
                                plural(recommendation.total, "screenshot"));
            LOG_INFO("All {} screenshot(s) match", recommendation.total);
        }

        return recommendation;
    }

} // namespace evaluation
