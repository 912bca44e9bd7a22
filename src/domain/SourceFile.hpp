/**
 * @file SourceFile.hpp
 * @brief Value types for uploaded files as they move through the pipeline.
 */

#pragma once
#include <map>
#include <string>

namespace solverify::domain {

/**
 * @struct PathBuffer
 * @brief A raw uploaded file: a path label and its bytes.
 *
 * Archives are still opaque at this stage. The label may be empty when the
 * caller had no name for the buffer.
 */
struct PathBuffer {
    std::string path;   ///< Label the file was submitted or extracted under.
    std::string buffer; ///< Raw bytes.
};

/**
 * @struct PathContent
 * @brief A file after archive expansion, viewed as text.
 */
struct PathContent {
    std::string path;
    std::string content;
};

/// Source path -> content.
using StringMap = std::map<std::string, std::string>;

} // namespace solverify::domain
