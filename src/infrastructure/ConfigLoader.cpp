/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace solverify::infrastructure {

ConfigLoader::Settings ConfigLoader::Parse(const std::string& text) {
    Settings settings;
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] Settings must be a JSON object" << std::endl;
            return settings;
        }

        if (j.contains("staging_dir") && j["staging_dir"].is_string()) {
            settings.stagingDir = j["staging_dir"].get<std::string>();
        }
        if (j.contains("parallel_resolution") && j["parallel_resolution"].is_boolean()) {
            settings.parallelResolution = j["parallel_resolution"].get<bool>();
        }
        if (j.contains("log_level") && j["log_level"].is_string()) {
            settings.logLevel = j["log_level"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings: " << e.what() << std::endl;
    }
    return settings;
}

ConfigLoader::Settings ConfigLoader::Load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        std::cerr << "[ConfigLoader] Settings file not found: " << configPath << std::endl;
        return {};
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Could not open settings file: " << configPath << std::endl;
        return {};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str());
}

} // namespace solverify::infrastructure
