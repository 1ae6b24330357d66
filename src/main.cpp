// File: main.cpp

#include <cstdio>
#include <fmt/format.h>
#include <utility>

#include "app/application.hpp"
#include "app/options.hpp"

int main(const int argc, char *argv[]) {
    app::Options options;
    try {
        options = app::parseArguments(argc, argv);
    } catch (const app::UsageError &e) {
        fmt::print(stderr, "error: {}\n\n{}", e.what(), app::usage());
        return 2;
    }

    if (options.help) {
        fmt::print("{}", app::usage());
        return 0;
    }

    return app::Application(std::move(options)).run();
}
