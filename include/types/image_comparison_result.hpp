// File: include/types/image_comparison_result.hpp

#ifndef IMAGE_COMPARISON_RESULT_HPP
#define IMAGE_COMPARISON_RESULT_HPP

#include <map>
#include <opencv2/core.hpp>
#include <string>
#include <utility>

namespace types {
    struct ImageComparisonResult {
        std::string method;
        double score{};
        cv::Mat difference;
        std::map<std::string, double> additional_metrics;

        ImageComparisonResult() = default;

        ImageComparisonResult(std::string method, double score, cv::Mat difference,
                              std::map<std::string, double> additional_metrics)
            : method(std::move(method)), score(score), difference(std::move(difference)),
              additional_metrics(std::move(additional_metrics)) {
        }
    };
}

#endif // IMAGE_COMPARISON_RESULT_HPP
