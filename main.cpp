/**
 * @file main.cpp
 * @brief sessionlens CLI entry point.
 */

#include <iostream>
#include <optional>
#include <string>

#include "app/SessionLensApp.hpp"

using namespace sessionlens;

namespace {

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <events.ndjson> [settings.json]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        PrintUsage(argv[0]);
        return 2;
    }

    std::optional<std::string> settingsPath;
    if (argc == 3) settingsPath = argv[2];

    app::SessionLensApp application(argv[1], settingsPath);
    return application.Run(std::cout);
}
