/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading verification settings (settings.json).
 *
 * Keeps JSON parsing of the configuration file in one place. Every key is
 * optional; absent keys leave the engine defaults in place.
 */

#pragma once

#include <optional>
#include <string>

namespace solverify::infrastructure {

class ConfigLoader {
public:
    struct Settings {
        std::optional<std::string> stagingDir;       ///< "staging_dir"
        std::optional<bool> parallelResolution;      ///< "parallel_resolution"
        std::optional<std::string> logLevel;         ///< "log_level": "info", "warning" or "error"
    };

    /**
     * @brief Reads settings from a JSON file.
     * @param configPath Path to the settings file.
     * @return Parsed settings; empty settings if the file is missing or unreadable.
     */
    static Settings Load(const std::string& configPath);

    /** @brief Parses settings from JSON text; malformed text yields empty settings. */
    static Settings Parse(const std::string& text);
};

} // namespace solverify::infrastructure
