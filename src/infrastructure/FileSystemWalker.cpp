/**
 * @file FileSystemWalker.cpp
 * @brief Implementation of FileSystemWalker.
 */

#include "infrastructure/FileSystemWalker.hpp"
#include <algorithm>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace solverify::infrastructure {

void FileSystemWalker::Walk(const fs::path& root, const Visitor& visitor) {
    fs::file_status status = fs::symlink_status(root);
    if (!fs::exists(status)) {
        throw fs::filesystem_error("Encountered a nonexistent path", root,
                                   std::make_error_code(std::errc::no_such_file_or_directory));
    }

    if (fs::is_regular_file(status)) {
        if (visitor.onFile) visitor.onFile(root);
        return;
    }
    if (!fs::is_directory(status)) {
        return;
    }

    std::vector<fs::path> children;
    for (const auto& entry : fs::directory_iterator(root)) {
        children.push_back(entry.path());
    }
    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        Walk(child, visitor);
    }
    if (visitor.onLeaveDirectory) visitor.onLeaveDirectory(root);
}

} // namespace solverify::infrastructure
