// =================================================================
// include/DiffLens/IgnorePattern.hpp
// =================================================================
// Segment-aware glob matching for filtering watch events.

#pragma once

#include <string>
#include <vector>

namespace DiffLens {

/**
 * @brief A compiled glob pattern matched against '/'-separated paths.
 *
 * Supported syntax:
 * - `**` as a whole segment: zero or more path segments
 * - `*`: any run of characters within one segment
 * - `?`: one character within one segment
 * - `\`: escapes the next character
 * - leading `!`: negates the pattern
 * - leading `/`: anchors the pattern at the path root
 * - trailing `/`: same as a trailing `/**`
 *
 * Unanchored patterns may start at any segment boundary. A pattern that
 * matches a leading run of segments matches everything below it as well.
 * Matching walks segments directly and never builds a regex.
 */
class IgnorePattern {
public:
    /**
     * @brief Compile a pattern
     * @param pattern The pattern string
     */
    explicit IgnorePattern(const std::string& pattern);

    /**
     * @brief Check if a path matches this pattern, ignoring negation
     * @param path Path relative to the watch base, '/'-separated
     */
    bool matches(const std::string& path) const;

    /**
     * @brief Check if this is a negation pattern (starts with !)
     */
    bool isNegation() const { return m_is_negation; }

    /**
     * @brief Check if pattern is empty or a comment
     */
    bool isEmpty() const { return m_is_empty; }

private:
    std::vector<std::string> m_segments;
    bool m_is_negation;
    bool m_is_anchored;
    bool m_is_empty;

    void processPattern(const std::string& pattern);

    bool matchFrom(const std::vector<std::string>& path, size_t pattern_index, size_t path_index) const;

    /**
     * @brief Match one segment against one wildcard segment pattern
     */
    static bool matchSegment(const std::string& pattern, const std::string& segment);
};

/**
 * @brief Collection of ignore patterns.
 *
 * A path is ignored when any pattern says so: a plain pattern by matching
 * it, a negated pattern by not matching it.
 */
class IgnorePatternSet {
public:
    IgnorePatternSet() = default;
    explicit IgnorePatternSet(const std::vector<std::string>& patterns);

    void addPattern(const std::string& pattern);

    /**
     * @brief Check if a path should be ignored
     * @param path Relative path from the watch base
     */
    bool shouldIgnore(const std::string& path) const;

    size_t size() const { return m_patterns.size(); }

private:
    std::vector<IgnorePattern> m_patterns;
};

/**
 * @brief Splits a path on '/' and drops empty segments.
 */
std::vector<std::string> splitPathSegments(const std::string& path);

} // namespace DiffLens
