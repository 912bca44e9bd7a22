/**
 * @file VariationHashIndex.hpp
 * @brief Keccak-256 index over line-ending and trailing-whitespace variants of sources.
 */

#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "domain/SourceFile.hpp"

namespace solverify::application {

/**
 * @class VariationHashIndex
 * @brief Maps the hash of every plausible byte form of a source to that form.
 *
 * Each file contributes 3 line-ending forms x 6 trailing forms. Entries keep
 * the submitted file's path; the content stored is the variant that produced
 * the hash. On collisions the file added last wins. The index is built once
 * per run and only read afterwards.
 */
class VariationHashIndex {
public:
    static constexpr size_t kVariationsPerFile = 18;

    static VariationHashIndex Build(const std::vector<domain::PathContent>& sources);

    void add(const domain::PathContent& source);

    /** @return The matching variant, or nullptr. */
    const domain::PathContent* find(const std::string& keccak256) const;

    size_t size() const { return m_byHash.size(); }

    /** @brief The 18 variants of content, in a fixed order (duplicates kept). */
    static std::vector<std::string> GenerateVariations(const std::string& content);

    /** @brief Strips trailing whitespace, including Unicode space separators encoded as UTF-8. */
    static std::string TrimEnd(const std::string& content);

private:
    std::unordered_map<std::string, domain::PathContent> m_byHash;
};

} // namespace solverify::application
