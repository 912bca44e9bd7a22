/**
 * @file ValidationService.hpp
 * @brief Entry point: turns uploaded files into checked contracts.
 */

#pragma once
#include <string>
#include <vector>
#include "application/ValidationConfig.hpp"
#include "domain/CheckedContract.hpp"
#include "domain/SourceFile.hpp"

namespace solverify::application {

/**
 * @class ValidationService
 * @brief Orchestrates expansion, classification, indexing and resolution.
 *
 * Synchronous; each call builds its own hash index and keeps no state
 * between calls.
 */
class ValidationService {
public:
    explicit ValidationService(ValidationConfig config = {});

    /**
     * @brief Checks every metadata file found below the given paths.
     * @param paths Regular files, directories or zip archives.
     * @param ignoring Optional collector for unreadable paths; without it they abort the run.
     * @param unused Optional collector for uploaded sources no metadata referenced.
     * @throws domain::ValidationError if no usable metadata is found.
     */
    std::vector<domain::CheckedContract> checkPaths(const std::vector<std::string>& paths,
                                                    std::vector<std::string>* ignoring = nullptr,
                                                    std::vector<std::string>* unused = nullptr) const;

    /**
     * @brief Checks in-memory files. Archives among them are expanded.
     * @param files Uploaded buffers.
     * @param unused Optional collector for uploaded sources no metadata referenced.
     * @return One CheckedContract per metadata document, in discovery order.
     * @throws domain::ValidationError if no usable metadata is found.
     */
    std::vector<domain::CheckedContract> checkFiles(const std::vector<domain::PathBuffer>& files,
                                                    std::vector<std::string>* unused = nullptr) const;

    /**
     * @brief Widens a contract with every uploaded source, not just the declared ones.
     *
     * Already verified sources win on key collisions. Does not fail when the
     * files carry no metadata.
     */
    domain::CheckedContract useAllSources(const domain::CheckedContract& contract,
                                          const std::vector<domain::PathBuffer>& files) const;

    const ValidationConfig& getConfig() const { return m_config; }

private:
    std::vector<domain::PathContent> expandToText(const std::vector<domain::PathBuffer>& files) const;

    ValidationConfig m_config;
};

} // namespace solverify::application
