/**
 * @file ValidationConfig.hpp
 * @brief Settings injected into the validation engine.
 */

#pragma once
#include <filesystem>
#include <functional>
#include <string>

namespace solverify::application {

enum class LogLevel { Info, Warning, Error };

/// Receives diagnostic messages. An empty sink turns logging off.
using LogSink = std::function<void(LogLevel, const std::string&)>;

/**
 * @struct ValidationConfig
 * @brief Engine configuration; copied into each service that needs it.
 */
struct ValidationConfig {
    LogSink logger;
    LogLevel minLogLevel = LogLevel::Warning;

    /** Parent of transient archive extraction directories. Empty means the system temp directory. */
    std::filesystem::path stagingRoot;

    /** Resolve metadata documents concurrently once the hash index is built. */
    bool parallelResolution = false;

    void log(LogLevel level, const std::string& message) const {
        if (logger && level >= minLogLevel) logger(level, message);
    }

    std::filesystem::path resolvedStagingRoot() const {
        return stagingRoot.empty() ? std::filesystem::temp_directory_path() : stagingRoot;
    }
};

inline std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
    }
    return "info";
}

} // namespace solverify::application
