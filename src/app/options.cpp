// File: app/options.cpp

#include "app/options.hpp"

#include <charconv>
#include <fmt/format.h>
#include <string_view>
#include <system_error>

namespace app {

    namespace {
        double parseNumber(const std::string_view flag, const std::string_view text) {
            double value = 0.0;
            const auto *end = text.data() + text.size();
            const auto [ptr, error] = std::from_chars(text.data(), end, value);
            if (error != std::errc() || ptr != end) {
                throw UsageError(fmt::format("{} expects a number, got '{}'", flag, text));
            }
            return value;
        }
    } // namespace

    Options parseArguments(const int argc, const char *const argv[]) {
        Options options;

        for (int i = 1; i < argc; ++i) {
            const std::string_view flag = argv[i];

            const auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw UsageError(fmt::format("{} expects a value", flag));
                }
                return argv[++i];
            };

            if (flag == "-h" || flag == "--help") {
                options.help = true;
            } else if (flag == "-c" || flag == "--config") {
                options.config_file = value();
            } else if (flag == "--layout") {
                options.layout = value();
            } else if (flag == "--root") {
                options.root = value();
            } else if (flag == "--left") {
                options.left_directory = value();
            } else if (flag == "--right") {
                options.right_directory = value();
            } else if (flag == "--left-name") {
                options.left_name = value();
            } else if (flag == "--right-name") {
                options.right_name = value();
            } else if (flag == "-o" || flag == "--output") {
                options.output_directory = value();
            } else if (flag == "--log-level") {
                options.log_level = value();
            } else if (flag == "--match-threshold") {
                options.match_threshold = parseNumber(flag, value());
            } else if (flag == "--review-threshold") {
                options.review_threshold = parseNumber(flag, value());
            } else if (flag == "--parallel") {
                options.parallel = true;
            } else {
                throw UsageError(fmt::format("Unknown argument '{}'", flag));
            }
        }

        if (options.left_directory.has_value() != options.right_directory.has_value()) {
            throw UsageError("--left and --right must be given together");
        }
        return options;
    }

    std::string usage() {
        return "Usage: shotdiff [options]\n"
               "\n"
               "Compares exploratory and scripted screenshots and writes diff images plus a report.\n"
               "\n"
               "Options:\n"
               "  -c, --config FILE          configuration file (default: ./configuration.yaml if present)\n"
               "      --layout NAME          runs | prefixed | directories\n"
               "      --root DIR             capture root for the runs and prefixed layouts\n"
               "      --left DIR             left capture directory (implies --layout directories)\n"
               "      --right DIR            right capture directory (implies --layout directories)\n"
               "      --left-name NAME       left side name / prefix (default: explore)\n"
               "      --right-name NAME      right side name / prefix (default: script)\n"
               "  -o, --output DIR           output directory for diff images and the report\n"
               "      --match-threshold RMS  below this a pair matches (default: 22.0)\n"
               "      --review-threshold RMS from here on a pair is a major diff (default: 30.0)\n"
               "      --parallel             compare pairs on all cores\n"
               "      --log-level LEVEL      trace | debug | info | warn | error | critical | off\n"
               "  -h, --help                 show this help\n";
    }

} // namespace app
