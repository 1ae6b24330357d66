// File: evaluation/recommendation.hpp

#ifndef EVALUATION_RECOMMENDATION_HPP
#define EVALUATION_RECOMMENDATION_HPP

#include <vector>

#include "types/run_report.hpp"

namespace evaluation {

    class RecommendationSynthesizer {
    public:
        /**
         * @brief Aggregates the verdicts of a run into one recommendation.
         *
         * Any major diff means the scripts need an update, with the first major diff (in the order given) as the
         * divergence point. Otherwise any minor diff means a review is needed. Otherwise all is clear.
         *
         * @param compared Compared pairs in key order.
         * @throws common::ConfigurationError if nothing was compared.
         */
        [[nodiscard]] static types::Recommendation synthesize(const std::vector<types::ComparedPair> &compared);
    };

} // namespace evaluation

#endif // EVALUATION_RECOMMENDATION_HPP
