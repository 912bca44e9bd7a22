/**
 * @file FileSystemWalker.hpp
 * @brief Deterministic recursive traversal of files and directories.
 */

#pragma once
#include <filesystem>
#include <functional>

namespace solverify::infrastructure {

/**
 * @class FileSystemWalker
 * @brief Visits every regular file below a path in sorted order.
 *
 * Symbolic links are neither followed nor reported.
 */
class FileSystemWalker {
public:
    struct Visitor {
        std::function<void(const std::filesystem::path&)> onFile;
        /** Called after all children of a directory were visited. */
        std::function<void(const std::filesystem::path&)> onLeaveDirectory;
    };

    /**
     * @brief Walks root, which may itself be a regular file.
     * @throws std::filesystem::filesystem_error if root does not exist.
     */
    static void Walk(const std::filesystem::path& root, const Visitor& visitor);
};

} // namespace solverify::infrastructure
