/**
 * @file CheckedContract.hpp
 * @brief Result of matching one metadata document against the uploaded sources.
 */

#pragma once
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "domain/CompilerMetadata.hpp"
#include "domain/SourceFile.hpp"

namespace solverify::domain {

/**
 * @struct MissingSource
 * @brief A declared source for which no content with the declared hash was found.
 */
struct MissingSource {
    std::string keccak256;
    std::vector<std::string> urls;

    bool operator==(const MissingSource& other) const {
        return keccak256 == other.keccak256 && urls == other.urls;
    }
};

/**
 * @struct InvalidSource
 * @brief Inline metadata content whose hash disagrees with the declared hash.
 */
struct InvalidSource {
    std::string expectedHash;
    std::string calculatedHash;
    std::string msg;

    bool operator==(const InvalidSource& other) const {
        return expectedHash == other.expectedHash && calculatedHash == other.calculatedHash;
    }
};

using MissingSources = std::map<std::string, MissingSource>;
using InvalidSources = std::map<std::string, InvalidSource>;

/**
 * @class CheckedContract
 * @brief Immutable aggregate: one metadata document with its found, missing and
 *        invalid sources.
 */
class CheckedContract {
public:
    CheckedContract(CompilerMetadata metadata,
                    StringMap solidity,
                    MissingSources missing,
                    InvalidSources invalid);

    const CompilerMetadata& getMetadata() const { return m_metadata; }

    /** @brief Verified sources keyed by their path as declared in metadata. */
    const StringMap& getSolidity() const { return m_solidity; }
    const MissingSources& getMissing() const { return m_missing; }
    const InvalidSources& getInvalid() const { return m_invalid; }

    const std::string& getName() const { return m_metadata.getTargetName(); }
    const std::string& getCompiledPath() const { return m_metadata.getTargetPath(); }
    const std::string& getCompilerVersion() const { return m_metadata.getCompilerVersion(); }

    /**
     * @brief A contract is valid when no source is missing or invalid.
     * @param ignoreMissing Only require the absence of invalid sources.
     */
    bool isValid(bool ignoreMissing = false) const;

    /** @brief Multi-line human readable summary. */
    std::string getInfo() const;

    /** @brief Structured summary for reporting layers. */
    nlohmann::json toJson() const;

    bool operator==(const CheckedContract& other) const;
    bool operator!=(const CheckedContract& other) const { return !(*this == other); }

private:
    CompilerMetadata m_metadata;
    StringMap m_solidity;
    MissingSources m_missing;
    InvalidSources m_invalid;
};

} // namespace solverify::domain
