// File: evaluation/classifier.hpp

#ifndef EVALUATION_CLASSIFIER_HPP
#define EVALUATION_CLASSIFIER_HPP

#include "types/verdict.hpp"

namespace evaluation {

    /*
     * Maps an RMS score to a verdict:
     *   rms <  match            -> Match (rendering noise, e.g. font smoothing between engines)
     *   match <= rms < review   -> MinorDiff
     *   rms >= review           -> MajorDiff
     * Every input has a verdict; NaN falls through to MajorDiff.
     */
    class Classifier {
    public:
        static constexpr double default_match_threshold = 22.0;
        static constexpr double default_review_threshold = 30.0;

        // Throws std::invalid_argument unless 0 <= match < review and both are finite.
        explicit Classifier(types::Thresholds thresholds = {});

        // Thresholds from "classifier.match_threshold" and "classifier.review_threshold".
        [[nodiscard]] static Classifier fromConfiguration();

        [[nodiscard]] types::Verdict classify(double rms) const noexcept;

        [[nodiscard]] const types::Thresholds &thresholds() const noexcept { return thresholds_; }

    private:
        types::Thresholds thresholds_;
    };

} // namespace evaluation

#endif // EVALUATION_CLASSIFIER_HPP
