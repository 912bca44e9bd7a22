#include <iostream>
#include <string>
#include <vector>

#include "application/ValidationReport.hpp"
#include "application/ValidationService.hpp"
#include "domain/ValidationError.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileCollector.hpp"

using namespace solverify;

namespace {

void PrintUsage() {
    std::cerr << "Usage: solverify [--config <settings.json>] [--all-sources] [--unused] <path>...\n"
              << "  Checks Solidity metadata files and sources found below the given paths\n"
              << "  (files, directories or zip archives) and prints a JSON report.\n";
}

application::LogLevel ParseLogLevel(const std::string& name) {
    if (name == "info") return application::LogLevel::Info;
    if (name == "error") return application::LogLevel::Error;
    if (name != "warning") {
        std::cerr << "[solverify] Unknown log_level '" << name << "', using warning" << std::endl;
    }
    return application::LogLevel::Warning;
}

application::ValidationConfig BuildConfig(const std::string& configPath) {
    application::ValidationConfig config;
    config.logger = [](application::LogLevel level, const std::string& message) {
        std::cerr << "[solverify] " << application::LogLevelToString(level) << ": " << message << std::endl;
    };

    if (configPath.empty()) return config;

    auto settings = infrastructure::ConfigLoader::Load(configPath);
    if (settings.stagingDir) config.stagingRoot = *settings.stagingDir;
    if (settings.parallelResolution) config.parallelResolution = *settings.parallelResolution;
    if (settings.logLevel) config.minLogLevel = ParseLogLevel(*settings.logLevel);
    return config;
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath;
    bool allSources = false;
    bool reportUnused = false;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--all-sources") {
            allSources = true;
        } else if (arg == "--unused") {
            reportUnused = true;
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[solverify] Unknown option: " << arg << std::endl;
            PrintUsage();
            return 1;
        } else {
            paths.push_back(arg);
        }
    }

    if (paths.empty()) {
        PrintUsage();
        return 1;
    }

    application::ValidationService service(BuildConfig(configPath));

    std::vector<std::string> ignored;
    std::vector<std::string> unused;
    std::vector<domain::CheckedContract> contracts;
    try {
        contracts = service.checkPaths(paths, &ignored, reportUnused ? &unused : nullptr);

        if (allSources) {
            // Reading the paths again is cheap next to hashing; ignored paths stay ignored.
            std::vector<std::string> ignoredAgain;
            auto files = infrastructure::FileCollector::Collect(paths, &ignoredAgain);
            for (auto& contract : contracts) {
                contract = service.useAllSources(contract, files);
            }
        }
    } catch (const domain::ValidationError& e) {
        std::cout << application::ValidationReport::Render(
                         application::ValidationReport::Failure(e.what(), ignored)) << std::endl;
        return 1;
    }

    bool allValid = true;
    for (const auto& contract : contracts) {
        allValid = allValid && contract.isValid();
    }

    auto report = application::ValidationReport::Build(contracts, ignored, reportUnused ? &unused : nullptr);
    std::cout << application::ValidationReport::Render(report) << std::endl;
    return allValid ? 0 : 2;
}
