/**
 * @file CompilerMetadata.hpp
 * @brief Typed view of a Solidity compiler metadata document.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace solverify::domain {

/**
 * @struct MetadataSource
 * @brief One entry of the metadata "sources" section.
 */
struct MetadataSource {
    std::optional<std::string> content; ///< Inline source text, if the compiler embedded it.
    std::string keccak256;              ///< Declared hash, lowercase "0x"-prefixed hex.
    std::vector<std::string> urls;      ///< Alternate locations (bzzr, ipfs, ...).
};

/**
 * @class CompilerMetadata
 * @brief Metadata document emitted by solc for exactly one compiled contract.
 *
 * Instances only exist for documents that passed validation: language is
 * "Solidity", a compiler section is present and settings.compilationTarget
 * holds exactly one entry.
 */
class CompilerMetadata {
public:
    const std::string& getLanguage() const { return m_language; }
    const std::string& getCompilerVersion() const { return m_compilerVersion; }
    const std::map<std::string, MetadataSource>& getSources() const { return m_sources; }

    /** @brief Source path of the single compilation target. */
    const std::string& getTargetPath() const { return m_targetPath; }

    /** @brief Contract name of the single compilation target. */
    const std::string& getTargetName() const { return m_targetName; }

    /** @brief The document as parsed, for consumers that recompile from it. */
    const nlohmann::json& getRaw() const { return m_raw; }

    /** @brief Label of the file this document came from (may be empty). */
    const std::string& getOrigin() const { return m_origin; }
    void setOrigin(const std::string& origin) { m_origin = origin; }

    bool operator==(const CompilerMetadata& other) const { return m_raw == other.m_raw; }

private:
    friend struct MetadataParseResult;

    std::string m_language;
    std::string m_compilerVersion;
    std::map<std::string, MetadataSource> m_sources;
    std::string m_targetPath;
    std::string m_targetName;
    nlohmann::json m_raw;
    std::string m_origin;
};

/**
 * @struct MetadataParseResult
 * @brief Outcome of validating a JSON value as compiler metadata.
 */
struct MetadataParseResult {
    enum class Status {
        Ok,                         ///< metadata holds the typed document.
        NotMetadata,                ///< Some other JSON (or not JSON at all).
        MalformedCompilationTarget  ///< Metadata, but compilationTarget size != 1.
    };

    Status status = Status::NotMetadata;
    std::optional<CompilerMetadata> metadata;
    std::string reason;

    bool ok() const { return status == Status::Ok; }

    /**
     * @brief Validates an already parsed JSON value.
     * @param doc Candidate document.
     * @return Discriminated result; never throws on unexpected shapes.
     */
    static MetadataParseResult FromJson(const nlohmann::json& doc);

    /**
     * @brief Parses text as metadata.
     *
     * Accepts plain JSON and JSON that encodes a JSON string holding the
     * document (the double encoding produced by truffle artifacts).
     */
    static MetadataParseResult FromText(const std::string& text);
};

} // namespace solverify::domain
