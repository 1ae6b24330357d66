// File: capture/run_resolver.hpp

#ifndef CAPTURE_RUN_RESOLVER_HPP
#define CAPTURE_RUN_RESOLVER_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace capture {

    struct CaptureFile {
        std::string key;
        std::filesystem::path path;
    };

    // One side of a run: a name ("explore", "script") and its screenshots, sorted by path.
    struct CaptureSide {
        std::string name;
        std::filesystem::path directory;
        std::vector<CaptureFile> files;
    };

    struct RunLayout {
        std::string run_id;
        std::filesystem::path base_directory; // default parent of the diff output directory
        CaptureSide left;
        CaptureSide right;
    };

    // Locates the active run and lists both capture sides. Failures are common::ConfigurationError.
    class RunResolver {
    public:
        virtual ~RunResolver() = default;

        [[nodiscard]] virtual RunLayout resolve() const = 0;

        // Builds the strategy selected by "capture.layout" (runs, prefixed, directories).
        static std::unique_ptr<RunResolver> create();

    protected:
        RunResolver() = default;
    };

    // <root>/<run>/<left>/*.png and <root>/<run>/<right>/*.png; the lexicographically greatest run wins.
    class LatestRunResolver : public RunResolver {
    public:
        LatestRunResolver(std::filesystem::path root, std::string left_name, std::string right_name,
                          std::vector<std::string> extensions);

        [[nodiscard]] RunLayout resolve() const override;

        // Runs under the root that carry both capture sides, sorted by name.
        [[nodiscard]] std::vector<std::filesystem::path> candidates() const;

    private:
        std::filesystem::path root_;
        std::string left_name_, right_name_;
        std::vector<std::string> extensions_;
    };

    // Flat directory with "<left>-<key>.png" and "<right>-<key>.png" files.
    class PrefixedRunResolver : public RunResolver {
    public:
        PrefixedRunResolver(std::filesystem::path root, std::string left_prefix, std::string right_prefix,
                            std::vector<std::string> extensions);

        [[nodiscard]] RunLayout resolve() const override;

    private:
        std::filesystem::path root_;
        std::string left_prefix_, right_prefix_;
        std::vector<std::string> extensions_;
    };

    // Two explicit directories; keys are the file base names.
    class DirectoryPairResolver : public RunResolver {
    public:
        DirectoryPairResolver(std::filesystem::path left, std::filesystem::path right, std::vector<std::string> extensions,
                              std::string left_name = "left", std::string right_name = "right");

        [[nodiscard]] RunLayout resolve() const override;

    private:
        std::filesystem::path left_, right_;
        std::vector<std::string> extensions_;
        std::string left_name_, right_name_;
    };

    // Collects the files of one side keyed by base name. Duplicate keys keep the first file in sorted order.
    [[nodiscard]] CaptureSide listSide(const std::string &name, const std::filesystem::path &directory,
                                       const std::vector<std::string> &extensions);

    // Local timestamp used as run id when the layout has none, e.g. "20240521-142233".
    [[nodiscard]] std::string timestamp();

} // namespace capture

#endif // CAPTURE_RUN_RESOLVER_HPP
