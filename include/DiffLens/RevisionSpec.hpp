// =================================================================
// include/DiffLens/RevisionSpec.hpp
// =================================================================
// Validation and labelling of the revision arguments of a diff.

#pragma once

#include <optional>
#include <string>

namespace DiffLens {

struct ValidationResult {
    bool valid = true;
    std::string error;
};

/**
 * @brief True for "working", "staged" and ".".
 */
bool isSpecialRevision(const std::string& revision);

/**
 * @brief Checks that a string looks like something git can resolve.
 *
 * Accepts hashes with optional ^/~N suffixes, HEAD and @ with suffixes, the
 * special revisions, and names that satisfy git's branch-name rules.
 */
bool validateCommitish(const std::string& commitish);

/**
 * @brief Checks a target/base pair.
 *
 * Special revisions are only allowed as target, except "staged" as the base
 * of "working". A revision cannot be compared with itself.
 */
ValidationResult validateDiffArguments(const std::string& target,
                                       const std::optional<std::string>& base);

std::string shortHash(const std::string& hash);

/**
 * @brief "<base>...<target>", the range form passed to git diff.
 */
std::string commitRangeLabel(const std::string& base, const std::string& target);

} // namespace DiffLens
