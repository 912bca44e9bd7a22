/**
 * @file CheckedContract.cpp
 * @brief Implementation of CheckedContract.
 */

#include "domain/CheckedContract.hpp"
#include <sstream>

namespace solverify::domain {

CheckedContract::CheckedContract(CompilerMetadata metadata,
                                 StringMap solidity,
                                 MissingSources missing,
                                 InvalidSources invalid)
    : m_metadata(std::move(metadata)),
      m_solidity(std::move(solidity)),
      m_missing(std::move(missing)),
      m_invalid(std::move(invalid)) {}

bool CheckedContract::isValid(bool ignoreMissing) const {
    return (ignoreMissing || m_missing.empty()) && m_invalid.empty();
}

std::string CheckedContract::getInfo() const {
    std::stringstream ss;
    ss << getName() << " (" << getCompiledPath() << "):";

    if (isValid()) {
        ss << "\n  Found all " << m_solidity.size() << " sources";
        return ss.str();
    }

    ss << "\n  " << m_solidity.size() << " sources found";
    if (!m_missing.empty()) {
        ss << "\n  Missing sources:";
        for (const auto& [path, missing] : m_missing) {
            ss << "\n    " << path << " (keccak256: " << missing.keccak256 << ")";
        }
    }
    if (!m_invalid.empty()) {
        ss << "\n  Invalid sources:";
        for (const auto& [path, invalid] : m_invalid) {
            ss << "\n    " << path << " (expected: " << invalid.expectedHash
               << ", calculated: " << invalid.calculatedHash << ")";
        }
    }
    return ss.str();
}

nlohmann::json CheckedContract::toJson() const {
    nlohmann::json j = {
        {"name", getName()},
        {"compiledPath", getCompiledPath()},
        {"compilerVersion", getCompilerVersion()},
        {"valid", isValid()},
        {"files", nlohmann::json::object()},
        {"missing", nlohmann::json::object()},
        {"invalid", nlohmann::json::object()}
    };
    if (!m_metadata.getOrigin().empty()) {
        j["metadataFile"] = m_metadata.getOrigin();
    }

    for (const auto& [path, content] : m_solidity) {
        j["files"][path] = {{"size", content.size()}};
    }
    for (const auto& [path, missing] : m_missing) {
        j["missing"][path] = {{"keccak256", missing.keccak256}, {"urls", missing.urls}};
    }
    for (const auto& [path, invalid] : m_invalid) {
        j["invalid"][path] = {
            {"expectedHash", invalid.expectedHash},
            {"calculatedHash", invalid.calculatedHash},
            {"msg", invalid.msg}
        };
    }
    return j;
}

bool CheckedContract::operator==(const CheckedContract& other) const {
    return m_metadata == other.m_metadata &&
           m_solidity == other.m_solidity &&
           m_missing == other.m_missing &&
           m_invalid == other.m_invalid;
}

} // namespace solverify::domain
