// =================================================================
// include/DiffLens/ChunkParser.hpp
// =================================================================
// Turns the lines of one file block into line-addressed hunks.

#pragma once

#include "DiffLens/DiffTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace DiffLens {

struct HunkHeader {
    size_t oldStart = 0;
    size_t oldLines = 1;
    size_t newStart = 0;
    size_t newLines = 1;
};

struct LineCounts {
    size_t additions = 0;
    size_t deletions = 0;
};

/**
 * @brief Parses "@@ -O[,OL] +N[,NL] @@[section]".
 * @return The header values, or std::nullopt if the line does not match.
 *         Omitted run lengths default to 1.
 */
std::optional<HunkHeader> parseHunkHeader(const std::string& line);

/**
 * @brief Builds the ordered hunk list for a file block.
 *
 * Lines before the first hunk header are ignored. A line starting with "@@"
 * that does not parse closes the current hunk and drops the lines up to the
 * next valid header.
 *
 * @param lines All lines of the block, header lines included.
 */
std::vector<DiffChunk> parseChunks(const std::vector<std::string>& lines);

/**
 * @brief Counts add and delete lines across all hunks.
 */
LineCounts countLines(const std::vector<DiffChunk>& chunks);

} // namespace DiffLens
