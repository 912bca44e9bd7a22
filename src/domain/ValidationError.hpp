/**
 * @file ValidationError.hpp
 * @brief Error raised when a batch of files cannot produce any verifiable contract.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace solverify::domain {

/**
 * @class ValidationError
 * @brief Aborts a whole verification run.
 *
 * Raised for structural problems only: no metadata at all, a malformed
 * compilation target, or an unreadable path without an ignore collector.
 * Per-source problems are recorded in the CheckedContract instead.
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace solverify::domain
