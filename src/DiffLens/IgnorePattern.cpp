// =================================================================
// src/DiffLens/IgnorePattern.cpp
// =================================================================
// Implementation for segment-aware glob matching.

#include "DiffLens/IgnorePattern.hpp"
#include <algorithm>

namespace DiffLens {

std::vector<std::string> splitPathSegments(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

IgnorePattern::IgnorePattern(const std::string& pattern)
    : m_is_negation(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    processPattern(pattern);
}

void IgnorePattern::processPattern(const std::string& pattern) {
    std::string working_pattern = pattern;

    // Trim whitespace
    working_pattern.erase(0, working_pattern.find_first_not_of(" \t"));
    working_pattern.erase(working_pattern.find_last_not_of(" \t") + 1);

    // Skip empty lines and comments
    if (working_pattern.empty() || working_pattern[0] == '#') {
        m_is_empty = true;
        return;
    }

    if (working_pattern[0] == '!') {
        m_is_negation = true;
        working_pattern = working_pattern.substr(1);
    }

    if (!working_pattern.empty() && working_pattern[0] == '/') {
        m_is_anchored = true;
    }

    bool directory_only = !working_pattern.empty() && working_pattern.back() == '/';

    // Segments are split on unescaped '/' only.
    std::string current;
    for (size_t i = 0; i < working_pattern.size(); ++i) {
        char c = working_pattern[i];
        if (c == '\\' && i + 1 < working_pattern.size()) {
            current += c;
            current += working_pattern[++i];
        } else if (c == '/') {
            if (!current.empty()) {
                m_segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        m_segments.push_back(current);
    }

    if (m_segments.empty()) {
        m_is_empty = true;
        return;
    }

    if (directory_only) {
        m_segments.push_back("**");
    }

    // Adjacent ** segments are equivalent to one.
    m_segments.erase(std::unique(m_segments.begin(), m_segments.end(),
                                 [](const std::string& a, const std::string& b) {
                                     return a == "**" && b == "**";
                                 }),
                     m_segments.end());
}

bool IgnorePattern::matches(const std::string& path) const {
    if (m_is_empty) {
        return false;
    }

    std::vector<std::string> segments = splitPathSegments(path);
    if (m_is_anchored) {
        return matchFrom(segments, 0, 0);
    }

    for (size_t start = 0; start <= segments.size(); ++start) {
        if (matchFrom(segments, 0, start)) {
            return true;
        }
    }
    return false;
}

bool IgnorePattern::matchFrom(const std::vector<std::string>& path, size_t pattern_index,
                              size_t path_index) const {
    if (pattern_index == m_segments.size()) {
        return true;
    }

    const std::string& segment_pattern = m_segments[pattern_index];
    if (segment_pattern == "**") {
        for (size_t next = path_index; next <= path.size(); ++next) {
            if (matchFrom(path, pattern_index + 1, next)) {
                return true;
            }
        }
        return false;
    }

    if (path_index == path.size()) {
        return false;
    }

    return matchSegment(segment_pattern, path[path_index]) &&
           matchFrom(path, pattern_index + 1, path_index + 1);
}

bool IgnorePattern::matchSegment(const std::string& pattern, const std::string& segment) {
    // Greedy wildcard match that only backtracks to the most recent '*',
    // which keeps it linear in practice and quadratic at worst.
    size_t p = 0;
    size_t s = 0;
    size_t star = std::string::npos;
    size_t star_match = 0;

    while (s < segment.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            star_match = s;
            continue;
        }

        if (p < pattern.size()) {
            char expected = pattern[p];
            size_t width = 1;
            if (expected == '\\' && p + 1 < pattern.size()) {
                expected = pattern[p + 1];
                width = 2;
            } else if (expected == '?') {
                p += 1;
                s += 1;
                continue;
            }
            if (expected == segment[s]) {
                p += width;
                s += 1;
                continue;
            }
        }

        if (star == std::string::npos) {
            return false;
        }
        p = star + 1;
        s = ++star_match;
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

IgnorePatternSet::IgnorePatternSet(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        addPattern(pattern);
    }
}

void IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (!ignore_pattern.isEmpty()) {
        m_patterns.push_back(std::move(ignore_pattern));
    }
}

bool IgnorePatternSet::shouldIgnore(const std::string& path) const {
    return std::any_of(m_patterns.begin(), m_patterns.end(), [&path](const IgnorePattern& pattern) {
        bool matched = pattern.matches(path);
        return pattern.isNegation() ? !matched : matched;
    });
}

} // namespace DiffLens
