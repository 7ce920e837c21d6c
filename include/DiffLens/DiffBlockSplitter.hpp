// =================================================================
// include/DiffLens/DiffBlockSplitter.hpp
// =================================================================
// Splits raw "diff --git" text into per-file blocks and resolves each
// block's paths, status and counts.

#pragma once

#include "DiffLens/DiffTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace DiffLens {

/**
 * @brief Per-file summary record as reported by git alongside the diff.
 *
 * Records are positional: record i describes block i. Patches read from
 * stdin have no records at all.
 */
struct FileSummary {
    std::string file;
    std::optional<std::string> from;
    size_t insertions = 0;
    size_t deletions = 0;
    bool binary = false;
};

struct HeaderPaths {
    std::optional<std::string> oldPath;
    std::optional<std::string> newPath;
};

/**
 * @brief Splits text into lines on '\n'. A trailing newline yields a final
 * empty line, which every consumer ignores.
 */
std::vector<std::string> splitLines(const std::string& text);

/**
 * @brief Splits diff text at every line starting with "diff --git ".
 *
 * Text before the first such line is discarded. Blocks keep their header
 * line and are returned in encounter order.
 */
std::vector<std::string> splitDiffBlocks(const std::string& text);

/**
 * @brief Extracts both paths of a "diff --git <old> <new>" line.
 *
 * Tokenization honours double quotes and backslash-escaped spaces. An
 * unquoted header whose two halves name the same file is split in the middle,
 * so "a/dir x/f b/dir x/f" resolves too.
 *
 * @return std::nullopt when the line is not a header or is ambiguous.
 */
std::optional<HeaderPaths> parseDiffHeaderPaths(const std::string& header_line);

/**
 * @brief Parses the NUL-separated output of "git diff --numstat -z".
 */
std::vector<FileSummary> parseNumstat(const std::string& output);

/**
 * @brief Resolves one file block into a DiffFile.
 *
 * Path priority: rename lines, then ---/+++ lines, then the header line,
 * then the summary record. Status priority: new file mode or a /dev/null
 * source, deleted file mode or a /dev/null destination, differing old and
 * new paths, otherwise modified.
 *
 * @param block The block text, starting with its "diff --git " line.
 * @param summary The paired summary record, or nullptr for stdin patches
 *                (counts are then taken from the parsed hunks).
 * @return std::nullopt when no new path can be resolved.
 */
std::optional<DiffFile> parseFileBlock(const std::string& block, const FileSummary* summary);

} // namespace DiffLens
