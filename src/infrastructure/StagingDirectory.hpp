/**
 * @file StagingDirectory.hpp
 * @brief Scoped transient directory used while expanding archives.
 */

#pragma once
#include <filesystem>

namespace solverify::infrastructure {

/**
 * @class StagingDirectory
 * @brief Creates a uniquely named directory and removes it, with its contents,
 *        when the object goes out of scope.
 */
class StagingDirectory {
public:
    /**
     * @param parent Directory to create the staging directory in.
     * @throws std::filesystem::filesystem_error if it cannot be created.
     */
    explicit StagingDirectory(const std::filesystem::path& parent);
    ~StagingDirectory();

    StagingDirectory(const StagingDirectory&) = delete;
    StagingDirectory& operator=(const StagingDirectory&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace solverify::infrastructure
