// File: app/options.hpp

#ifndef APP_OPTIONS_HPP
#define APP_OPTIONS_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace app {

    struct Options {
        std::string config_file; // empty: ./configuration.yaml when present
        std::optional<std::string> layout;
        std::optional<std::string> root;
        std::optional<std::string> left_directory;
        std::optional<std::string> right_directory;
        std::optional<std::string> left_name;
        std::optional<std::string> right_name;
        std::optional<std::string> output_directory;
        std::optional<std::string> log_level;
        std::optional<double> match_threshold;
        std::optional<double> review_threshold;
        bool parallel{false};
        bool help{false};
    };

    class UsageError : public std::runtime_error {
    public:
        explicit UsageError(const std::string &message) : std::runtime_error(message) {}
    };

    // Throws UsageError for unknown flags, missing values and malformed numbers.
    [[nodiscard]] Options parseArguments(int argc, const char *const argv[]);

    [[nodiscard]] std::string usage();

} // namespace app

#endif // APP_OPTIONS_HPP
