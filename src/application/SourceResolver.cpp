/**
 * @file SourceResolver.cpp
 * @brief Implementation of SourceResolver.
 */

#include "application/SourceResolver.hpp"
#include "infrastructure/Keccak256.hpp"

namespace solverify::application {

SourceResolver::SourceResolver(const VariationHashIndex& index) : m_index(index) {}

SourceResolution SourceResolver::resolve(const domain::CompilerMetadata& metadata) const {
    SourceResolution resolution;

    for (const auto& [sourcePath, declared] : metadata.getSources()) {
        if (declared.content) {
            const std::string calculated = infrastructure::Keccak256::HexHash(*declared.content);
            if (calculated == declared.keccak256) {
                resolution.found[sourcePath] = *declared.content;
            } else {
                resolution.invalid[sourcePath] = domain::InvalidSource{
                    declared.keccak256,
                    calculated,
                    "The keccak256 given in the metadata and the calculated keccak256 of the source content in metadata don't match"
                };
            }
            continue;
        }

        if (const domain::PathContent* match = m_index.find(declared.keccak256)) {
            resolution.found[sourcePath] = match->content;
            resolution.metadataToProvided[sourcePath] = match->path;
        } else {
            resolution.missing[sourcePath] = domain::MissingSource{declared.keccak256, declared.urls};
        }
    }

    return resolution;
}

} // namespace solverify::application
