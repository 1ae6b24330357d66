// File: app/application.hpp

#ifndef APP_APPLICATION_HPP
#define APP_APPLICATION_HPP

#include <filesystem>

#include "app/options.hpp"
#include "capture/run_resolver.hpp"

namespace app {

    class Application {
    public:
        explicit Application(Options options);

        // Returns the process exit code: 0 on success, 1 when the run could not be reported.
        int run() const;

    private:
        Options options_;

        // Pushes command-line overrides into the configuration.
        void applyOverrides() const;

        // "output.directory" when set, otherwise <run base>/diffs/<timestamp>.
        [[nodiscard]] static std::filesystem::path outputDirectory(const capture::RunLayout &layout);
    };

} // namespace app

#endif // APP_APPLICATION_HPP
