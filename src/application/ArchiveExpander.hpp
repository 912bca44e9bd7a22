/**
 * @file ArchiveExpander.hpp
 * @brief Replaces zip archives in a file set by their members, recursively.
 */

#pragma once
#include <cstddef>
#include <vector>
#include "application/ValidationConfig.hpp"
#include "domain/SourceFile.hpp"

namespace solverify::application {

/**
 * @class ArchiveExpander
 * @brief Flattens uploaded files.
 *
 * A buffer counts as an archive when its central directory can be read; the
 * file name plays no role. Members are extracted to a scoped staging
 * directory and exposed under their path inside the archive. Nested archives
 * are expanded in turn, up to kMaxNestingDepth levels below the upload. A
 * buffer that cannot be extracted, or sits deeper than that, is kept as a
 * regular file.
 */
class ArchiveExpander {
public:
    static constexpr size_t kMaxNestingDepth = 16;

    explicit ArchiveExpander(ValidationConfig config);

    std::vector<domain::PathBuffer> expand(const std::vector<domain::PathBuffer>& files) const;

private:
    bool tryExtract(const domain::PathBuffer& file, std::vector<domain::PathBuffer>& members) const;

    ValidationConfig m_config;
};

} // namespace solverify::application
