/**
 * @file FileCollector.hpp
 * @brief Reads user supplied paths (files or directories) into memory.
 */

#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "domain/SourceFile.hpp"

namespace solverify::infrastructure {

/**
 * @class FileCollector
 * @brief Infrastructure adapter turning paths into PathBuffers.
 */
class FileCollector {
public:
    using IgnoreCallback = std::function<void(const std::string& path, const std::string& reason)>;

    /**
     * @brief Reads every regular file below the given paths.
     * @param paths Files or directories, traversed recursively.
     * @param ignoring When non-null, unreadable paths are appended here instead of aborting.
     * @param onIgnored Optional notification for each ignored path.
     * @return Files labelled with their absolute, normalized path.
     * @throws domain::ValidationError for an unreadable path when ignoring is null.
     */
    static std::vector<domain::PathBuffer> Collect(const std::vector<std::string>& paths,
                                                   std::vector<std::string>* ignoring = nullptr,
                                                   const IgnoreCallback& onIgnored = nullptr);

    /**
     * @brief Reads a whole file in binary mode.
     * @throws std::runtime_error if the file cannot be read.
     */
    static std::string ReadBinary(const std::filesystem::path& path);
};

} // namespace solverify::infrastructure
