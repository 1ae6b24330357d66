// File: pipeline/comparison_pipeline.hpp

#ifndef PIPELINE_COMPARISON_PIPELINE_HPP
#define PIPELINE_COMPARISON_PIPELINE_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "capture/run_resolver.hpp"
#include "evaluation/classifier.hpp"
#include "processing/image/comparator.hpp"
#include "types/run_report.hpp"

namespace pipeline {

    struct PipelineOptions {
        std::filesystem::path output_directory;
        std::string diff_prefix{"diff-"};
        bool parallel{false};
    };

    /*
     * Runs matching, decoding, normalization, diffing and classification for every complete pair of a run and
     * hands the ordered results to the recommendation synthesizer. A pair that fails is skipped with a
     * diagnostic; only run-level problems (nothing to compare) abort with common::ConfigurationError.
     */
    class ComparisonPipeline {
    public:
        ComparisonPipeline(std::shared_ptr<processing::image::ImageComparator> comparator,
                           evaluation::Classifier classifier, PipelineOptions options);

        [[nodiscard]] types::RunReport run(const capture::RunLayout &layout) const;

        // Compares one complete pair and writes its diff image. Throws on any failure.
        [[nodiscard]] types::ComparedPair compare(const types::ScreenshotPair &pair) const;

    private:
        struct PairOutcome {
            std::optional<types::ComparedPair> compared;
            std::optional<types::SkippedPair> skipped;
        };

        std::shared_ptr<processing::image::ImageComparator> comparator_;
        evaluation::Classifier classifier_;
        PipelineOptions options_;

        // Never throws; failures become a skipped entry.
        [[nodiscard]] PairOutcome evaluate(const types::ScreenshotPair &pair) const noexcept;
    };

} // namespace pipeline

#endif // PIPELINE_COMPARISON_PIPELINE_HPP
