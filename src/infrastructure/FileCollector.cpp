/**
 * @file FileCollector.cpp
 * @brief Implementation of FileCollector.
 */

#include "infrastructure/FileCollector.hpp"
#include "infrastructure/FileSystemWalker.hpp"
#include "domain/ValidationError.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace solverify::infrastructure {

std::string FileCollector::ReadBinary(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Could not read file: " + path.string());
    }
    return buffer.str();
}

std::vector<domain::PathBuffer> FileCollector::Collect(const std::vector<std::string>& paths,
                                                       std::vector<std::string>* ignoring,
                                                       const IgnoreCallback& onIgnored) {
    std::vector<domain::PathBuffer> files;

    auto ignore = [&](const std::string& path, const std::string& reason) {
        if (!ignoring) {
            throw domain::ValidationError(reason + ": " + path);
        }
        ignoring->push_back(path);
        if (onIgnored) onIgnored(path, reason);
    };

    for (const auto& path : paths) {
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(path, ec))) {
            ignore(path, "Encountered a nonexistent path");
            continue;
        }

        FileSystemWalker::Visitor visitor;
        visitor.onFile = [&](const fs::path& filePath) {
            std::string label = fs::absolute(filePath).lexically_normal().string();
            try {
                files.push_back({label, ReadBinary(filePath)});
            } catch (const std::runtime_error&) {
                ignore(label, "Unreadable file");
            }
        };

        try {
            FileSystemWalker::Walk(path, visitor);
        } catch (const fs::filesystem_error& e) {
            ignore(path, e.what());
        }
    }

    return files;
}

} // namespace solverify::infrastructure
