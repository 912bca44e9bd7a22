/**
 * @file ValidationReport.hpp
 * @brief JSON report printed by the command-line driver.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/CheckedContract.hpp"

namespace solverify::application {

class ValidationReport {
public:
    /**
     * @brief Report for a completed run.
     * @param unused Listed under "unused" when given.
     */
    static nlohmann::json Build(const std::vector<domain::CheckedContract>& contracts,
                                const std::vector<std::string>& ignored,
                                const std::vector<std::string>* unused = nullptr);

    /** @brief Report for a run aborted by a ValidationError. */
    static nlohmann::json Failure(const std::string& error, const std::vector<std::string>& ignored);

    /**
     * @brief Serializes a report with two-space indentation.
     *
     * File names come from disks and archives in arbitrary encodings; bytes
     * that are not valid UTF-8 are written as U+FFFD.
     */
    static std::string Render(const nlohmann::json& report);
};

} // namespace solverify::application
