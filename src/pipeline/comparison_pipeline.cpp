// File: pipeline/comparison_pipeline.cpp

#include "pipeline/comparison_pipeline.hpp"

#include <algorithm>
#include <ctime>
#include <execution>
#include <fmt/chrono.h>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>

#include "capture/pair_matcher.hpp"
#include "common/errors.hpp"
#include "common/io/image.hpp"
#include "common/io/io.hpp"
#include "common/logging/logger.hpp"
#include "common/timer.hpp"
#include "evaluation/recommendation.hpp"
#include "processing/image/normalizer.hpp"

namespace pipeline {

    ComparisonPipeline::ComparisonPipeline(std::shared_ptr<processing::image::ImageComparator> comparator,
                                           evaluation::Classifier classifier, PipelineOptions options) :
        comparator_(std::move(comparator)), classifier_(classifier), options_(std::move(options)) {
        if (!comparator_) {
            throw std::invalid_argument("ComparisonPipeline requires a comparator");
        }
        if (options_.output_directory.empty()) {
            throw std::invalid_argument("ComparisonPipeline requires an output directory");
        }
    }

    types::RunReport ComparisonPipeline::run(const capture::RunLayout &layout) const {
        Timer timer(fmt::format("screenshot comparison of run {}", layout.run_id));

        const auto pairs = capture::PairMatcher::match(layout);
        const auto complete = pairs.complete();
        if (complete.empty()) {
            LOG_ERROR("No {}/{} screenshot pairs found in run {}", layout.left.name, layout.right.name, layout.run_id);
            throw common::ConfigurationError(fmt::format("No {}/{} screenshot pairs found", layout.left.name,
                                                         layout.right.name));
        }

        common::io::createDirectory(options_.output_directory);
        LOG_INFO("Comparing {} screenshot pair(s) into {}{}", complete.size(), options_.output_directory.string(),
                 options_.parallel ? " (parallel)" : "");

        std::vector<PairOutcome> outcomes(complete.size());
        if (options_.parallel) {
            std::vector<std::size_t> indices(complete.size());
            std::iota(indices.begin(), indices.end(), std::size_t{0});
            std::for_each(std::execution::par, indices.begin(), indices.end(),
                          [&](const std::size_t index) { outcomes[index] = evaluate(complete[index]); });
        } else {
            for (std::size_t index = 0; index < complete.size(); ++index) {
                outcomes[index] = evaluate(complete[index]);
            }
        }

        types::RunReport report;
        report.run_id = layout.run_id;
        report.generated_at = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::time(nullptr)));
        report.left_name = layout.left.name;
        report.right_name = layout.right.name;
        report.left_directory = layout.left.directory;
        report.right_directory = layout.right.directory;
        report.output_directory = options_.output_directory;
        report.thresholds = classifier_.thresholds();
        report.unmatched = pairs.unmatched();

        // `complete` is in key order, so the outcomes are too
        for (auto &outcome: outcomes) {
            if (outcome.compared) {
                report.compared.push_back(std::move(*outcome.compared));
            } else if (outcome.skipped) {
                report.skipped.push_back(std::move(*outcome.skipped));
            }
        }

        if (report.compared.empty()) {
            LOG_ERROR("All {} screenshot pair(s) failed to compare", report.skipped.size());
            throw common::ConfigurationError(
                    fmt::format("None of the {} screenshot pair(s) could be compared", report.skipped.size()));
        }

        report.recommendation = evaluation::RecommendationSynthesizer::synthesize(report.compared);
        return report;
    }

    types::ComparedPair ComparisonPipeline::compare(const types::ScreenshotPair &pair) const {
        if (!pair.isComplete()) {
            throw std::invalid_argument(fmt::format("Screenshot pair '{}' is incomplete", pair.key()));
        }

        const auto left = processing::image::ImageNormalizer::load(*pair.left());
        const auto right = processing::image::ImageNormalizer::load(*pair.right());
        const auto normalized = processing::image::ImageNormalizer::normalizePair(left, right);
        if (normalized.size_mismatch) {
            LOG_WARN("'{}': size mismatch {} vs {}, compared on a padded canvas", pair.key(), normalized.first_size,
                     normalized.second_size);
        }

        const auto comparison = comparator_->compare(normalized.first, normalized.second);

        auto extension = pair.left()->extension().string();
        if (extension.empty()) {
            extension = ".png";
        }
        const auto diff_path = options_.output_directory / fmt::format("{}{}{}", options_.diff_prefix, pair.key(),
                                                                       extension);
        try {
            common::io::image::writeImage(diff_path, comparison.difference, false);
        } catch (const std::runtime_error &e) {
            throw common::DecodeError(fmt::format("Could not save diff image: {}", e.what()));
        }

        const auto verdict = classifier_.classify(comparison.score);
        LOG_INFO("'{}': rms {:.2f} -> {} ({})", pair.key(), comparison.score, verdict, types::describe(verdict));

        return types::ComparedPair{pair,
                                   types::DiffResult{pair.key(), comparison.score, normalized.size_mismatch,
                                                     normalized.first_size, normalized.second_size, diff_path},
                                   verdict};
    }

    ComparisonPipeline::PairOutcome ComparisonPipeline::evaluate(const types::ScreenshotPair &pair) const noexcept {
        PairOutcome outcome;
        try {
            outcome.compared = compare(pair);
        } catch (const common::DecodeError &e) {
            LOG_ERROR("Skipping '{}': {}", pair.key(), e.what());
            outcome.skipped = types::SkippedPair{pair, e.what()};
        } catch (const cv::Exception &e) {
            LOG_ERROR("Skipping '{}': OpenCV error: {}", pair.key(), e.what());
            outcome.skipped = types::SkippedPair{pair, fmt::format("image processing failed: {}", e.what())};
        } catch (const std::exception &e) {
            LOG_ERROR("Skipping '{}': unexpected error: {}", pair.key(), e.what());
            outcome.skipped = types::SkippedPair{pair, fmt::format("unexpected error: {}", e.what())};
        }
        return outcome;
    }

} // namespace pipeline
