// File: evaluation/classifier.cpp

#include "evaluation/classifier.hpp"

#include <cmath>
#include <stdexcept>

#include "common/logging/logger.hpp"
#include "config/configuration.hpp"

namespace evaluation {

    Classifier::Classifier(const types::Thresholds thresholds) : thresholds_(thresholds) {
        if (!std::isfinite(thresholds_.match) || !std::isfinite(thresholds_.review)) {
            throw std::invalid_argument("Classifier thresholds must be finite");
        }
        if (thresholds_.match < 0.0) {
            throw std::invalid_argument(fmt::format("Match threshold must not be negative (got {})", thresholds_.match));
        }
        if (thresholds_.match >= thresholds_.review) {
            throw std::invalid_argument(fmt::format("Match threshold ({}) must be below the review threshold ({})",
                                                    thresholds_.match, thresholds_.review));
        }
    }

    Classifier Classifier::fromConfiguration() {
        const types::Thresholds thresholds{config::require("classifier.match_threshold", default_match_threshold),
                                           config::require("classifier.review_threshold", default_review_threshold)};
        LOG_INFO("Classifier thresholds: match < {:.2f}, review < {:.2f}", thresholds.match, thresholds.review);
        return Classifier(thresholds);
    }

    types::Verdict Classifier::classify(const double rms) const noexcept {
        if (rms < thresholds_.match) {
            return types::Verdict::Match;
        }
        if (rms < thresholds_.review) {
            return types::Verdict::MinorDiff;
        }
        return types::Verdict::MajorDiff;
    }

} // namespace evaluation
