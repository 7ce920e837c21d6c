// =================================================================
// include/DiffLens/FileClassifier.hpp
// =================================================================
// Detection of files produced by tooling rather than written by hand.

#pragma once

#include <string>

namespace DiffLens {

/**
 * @brief Path-based check: lockfiles, minified assets, source maps.
 *
 * Cheap enough to run for every file of a diff; never reads content.
 */
bool isGeneratedPath(const std::string& path);

/**
 * @brief Content-based check: looks for a generator marker such as
 * "@generated" near the top of the file.
 */
bool hasGeneratedMarker(const std::string& content);

} // namespace DiffLens
