// =================================================================
// include/DiffLens/WatchMode.hpp
// =================================================================
// Diff modes and the static watch configuration of each mode.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace DiffLens {

/**
 * @brief What the served diff compares, which decides what to watch.
 */
enum class DiffMode {
    DEFAULT,   ///< A commit against its parent
    WORKING,   ///< Unstaged changes
    STAGED,    ///< Index against a base
    DOT,       ///< All uncommitted changes against a base
    SPECIFIC   ///< Two fixed revisions, nothing can change
};

/**
 * @brief How a change notification classifies the change.
 */
enum class ChangeType {
    FILE,
    COMMIT,
    STAGING
};

/**
 * @brief Roots, filters and classification for one diff mode.
 *
 * Ignore globs are written against paths relative to the working tree,
 * with anything under the git directory spelled ".git/<relative>".
 */
struct ModeWatchConfig {
    bool watchWorkingTree = false;
    bool watchGitDir = false;
    std::vector<std::string> ignoreGlobs;
    std::vector<std::string> relevantGitFiles;
    ChangeType changeType = ChangeType::COMMIT;
};

std::string toString(DiffMode mode);
std::string toString(ChangeType type);

/**
 * @brief Parses "default", "working", "staged", "dot" or "specific".
 * @throws std::invalid_argument for anything else.
 */
DiffMode diffModeFromString(const std::string& name);

/**
 * @brief The fixed watch table entry for a mode.
 */
ModeWatchConfig watchConfigFor(DiffMode mode);

/**
 * @brief Picks the mode from the command-line revisions.
 *
 * An explicit comparison whose target is neither HEAD nor "." is SPECIFIC.
 * Otherwise the special revisions select their own mode and anything else
 * is DEFAULT.
 */
DiffMode determineDiffMode(const std::string& target, const std::optional<std::string>& compare_with);

} // namespace DiffLens
