// File: app/application.cpp

#include "app/application.hpp"

#include <cstdio>
#include <fmt/format.h>
#include <optional>
#include <stdexcept>
#include <utility>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "evaluation/classifier.hpp"
#include "pipeline/comparison_pipeline.hpp"
#include "processing/image/comparator.hpp"
#include "reporting/report_writer.hpp"

namespace app {

    Application::Application(Options options) : options_(std::move(options)) {}

    void Application::applyOverrides() const {
        if (options_.left_directory && options_.right_directory) {
            config::set("capture.layout", std::string("directories"));
            config::set("capture.left.directory", *options_.left_directory);
            config::set("capture.right.directory", *options_.right_directory);
        }
        if (options_.layout) {
            config::set("capture.layout", *options_.layout);
        }
        if (options_.root) {
            config::set("capture.root", *options_.root);
        }
        if (options_.left_name) {
            config::set("capture.left.name", *options_.left_name);
        }
        if (options_.right_name) {
            config::set("capture.right.name", *options_.right_name);
        }
        if (options_.output_directory) {
            config::set("output.directory", *options_.output_directory);
        }
        if (options_.log_level) {
            config::set("logging.level", *options_.log_level);
        }
        if (options_.match_threshold) {
            config::set("classifier.match_threshold", *options_.match_threshold);
        }
        if (options_.review_threshold) {
            config::set("classifier.review_threshold", *options_.review_threshold);
        }
        if (options_.parallel) {
            config::set("pipeline.parallel", true);
        }
    }

    std::filesystem::path Application::outputDirectory(const capture::RunLayout &layout) {
        if (const auto directory = config::get<std::string>("output.directory"); directory && !directory->empty()) {
            return *directory;
        }
        return layout.base_directory / "diffs" / capture::timestamp();
    }

    int Application::run() const {
        try {
            config::initialize(options_.config_file);
            applyOverrides();

            common::logging::Logger::initialize(config::get("logging.directory", "./logs"),
                                                config::get("logging.filename", "shotdiff.log"),
                                                config::get("logging.level", "info"));
            config::show();

            std::optional<evaluation::Classifier> classifier;
            try {
                classifier.emplace(evaluation::Classifier::fromConfiguration());
            } catch (const std::invalid_argument &e) {
                throw common::ConfigurationError(fmt::format("Invalid classifier thresholds: {}", e.what()));
            }

            const auto layout = capture::RunResolver::create()->resolve();

            const pipeline::PipelineOptions pipeline_options{outputDirectory(layout),
                                                             config::get("output.diff_prefix", "diff-"),
                                                             config::require("pipeline.parallel", false)};
            const pipeline::ComparisonPipeline comparison(processing::image::ImageComparator::create(), *classifier,
                                                          pipeline_options);

            const auto report = comparison.run(layout);
            const auto report_path =
                    reporting::ReportWriter::fromConfiguration().write(report, pipeline_options.output_directory);

            fmt::print("Wrote {}\n{}\n", report_path.string(), report.recommendation.headline);
            return 0;
        } catch (const common::ConfigurationError &e) {
            LOG_CRITICAL("{}", e.what());
            fmt::print(stderr, "error: {}\n", e.what());
            return 1;
        } catch (const std::exception &e) {
            LOG_CRITICAL("Run failed: {}", e.what());
            fmt::print(stderr, "error: {}\n", e.what());
            return 1;
        }
    }

} // namespace app
