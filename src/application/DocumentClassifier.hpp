/**
 * @file DocumentClassifier.hpp
 * @brief Splits expanded files into metadata documents and source files.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "application/ValidationConfig.hpp"
#include "domain/CompilerMetadata.hpp"
#include "domain/SourceFile.hpp"

namespace solverify::application {

/**
 * @struct ClassifiedFiles
 * @brief Every input file ends up in exactly one bucket.
 */
struct ClassifiedFiles {
    std::vector<domain::CompilerMetadata> metadataFiles;
    /// Plain sources plus the sources unpacked from build-info documents.
    std::vector<domain::PathContent> sourceFiles;
    /// Labels of metadata documents whose compilationTarget does not hold exactly one entry.
    std::vector<std::string> malformedMetadataFiles;
};

/**
 * @class DocumentClassifier
 * @brief Recognizes metadata (plain, double-encoded or nested in another
 *        JSON document) and hardhat build-info files.
 */
class DocumentClassifier {
public:
    explicit DocumentClassifier(ValidationConfig config);

    /** @brief Classifies files; never throws for unexpected content. */
    ClassifiedFiles classify(const std::vector<domain::PathContent>& files) const;

    /**
     * @brief Rejects batches that cannot produce a verifiable contract.
     * @throws domain::ValidationError on malformed compilation targets or when
     *         no metadata was found.
     */
    void requireMetadata(const ClassifiedFiles& classified) const;

    /** @brief True when the text carries the hardhat build-info format marker. */
    static bool IsBuildInfo(const std::string& text);

    /**
     * @brief Finds metadata stored as an escaped JSON string inside another
     *        document, e.g. the "metadata" field of a truffle artifact.
     * @return The JSON string literal, quotes included, or nullopt.
     */
    static std::optional<std::string> FindNestedMetadata(const std::string& text);

private:
    bool extractBuildInfo(const domain::PathContent& file, ClassifiedFiles& out) const;

    ValidationConfig m_config;
};

} // namespace solverify::application
