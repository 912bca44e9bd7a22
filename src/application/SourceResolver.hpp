/**
 * @file SourceResolver.hpp
 * @brief Matches the sources declared by one metadata document against uploaded content.
 */

#pragma once
#include "application/VariationHashIndex.hpp"
#include "domain/CheckedContract.hpp"
#include "domain/CompilerMetadata.hpp"

namespace solverify::application {

/**
 * @struct SourceResolution
 * @brief Every declared source path appears in exactly one of found, missing or invalid.
 */
struct SourceResolution {
    domain::StringMap found;
    domain::MissingSources missing;
    domain::InvalidSources invalid;
    /// Declared source path -> path of the uploaded file that matched it by hash.
    domain::StringMap metadataToProvided;
};

/**
 * @class SourceResolver
 * @brief Stateless apart from a read-only reference to the hash index, so one
 *        instance can serve several threads.
 */
class SourceResolver {
public:
    explicit SourceResolver(const VariationHashIndex& index);

    /**
     * @brief Resolves every entry of metadata.sources.
     *
     * Inline content is authoritative: when its hash disagrees with the
     * declared one the source is invalid and the index is not consulted.
     */
    SourceResolution resolve(const domain::CompilerMetadata& metadata) const;

private:
    const VariationHashIndex& m_index;
};

} // namespace solverify::application
