#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

#include "app/PsycheApp.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace psyche;

namespace {

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <file>] [--verbose]\n"
              << "\n"
              << "  --config <file>  Runtime configuration (default: "
              << infrastructure::PathUtils::GetDefaultConfigPath().string() << ")\n"
              << "  --verbose        Log every percept and skipped decision\n"
              << "  --help           Show this message\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = infrastructure::PathUtils::GetDefaultConfigPath().string();
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    application::RuntimeConfig config;
    try {
        config = infrastructure::ConfigLoader::Load(configPath);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (verbose) config.cognition.verbose = true;

    app::PsycheApp psyche(std::move(config));
    return psyche.Run();
}
