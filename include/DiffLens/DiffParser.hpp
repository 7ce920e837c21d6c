// =================================================================
// include/DiffLens/DiffParser.hpp
// =================================================================
// Orchestrates git, block splitting, hunk parsing and classification
// into a DiffResponse.

#pragma once

#include "DiffLens/DiffBlockSplitter.hpp"
#include "DiffLens/DiffTypes.hpp"
#include "DiffLens/GitExecutor.hpp"
#include "DiffLens/TtlCache.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace DiffLens {

struct ParserOptions {
    /// Raise DiffParseError instead of dropping blocks without a path.
    bool strict = false;
    std::chrono::milliseconds generatedStatusTtl{60000};
    size_t maxBlobBytes = 10 * 1024 * 1024;
};

class DiffParser {
public:
    DiffParser(std::shared_ptr<GitExecutor> git, ParserOptions options = {});

    /**
     * @brief Diffs two revisions of the repository.
     *
     * The target may be "working" (unstaged changes), "staged" (index
     * against base) or "." (working tree against base).
     *
     * @throws DiffError naming both revisions on any validation or git failure.
     */
    DiffResponse parseDiff(const std::string& target, const std::string& base,
                           bool ignore_whitespace = false);

    /**
     * @brief Parses a raw unified diff with no summary records.
     *
     * Status and counts come from the text alone.
     */
    DiffResponse parsePatch(const std::string& raw_diff) const;

    /**
     * @brief Converts diff text plus positional summaries into files.
     */
    std::vector<DiffFile> parseUnifiedDiff(const std::string& diff_text,
                                           const std::vector<FileSummary>& summaries) const;

    /**
     * @brief Lazily classifies a file as generated.
     *
     * Path patterns win without reading content. Otherwise the blob at ref is
     * scanned for a generator marker; an unreadable blob yields
     * {false, path}. Results are cached per (ref, path).
     */
    GeneratedStatus getGeneratedStatus(const std::string& path, const std::string& ref);

    /**
     * @brief Reads a file's bytes at a ref ("working", ".", "staged" or a commit-ish).
     * @throws GitOutputTooLargeError when the blob exceeds the size limit.
     * @throws GitError for any other failure.
     */
    std::string getBlobContent(const std::string& path, const std::string& ref);

    size_t getLineCount(const std::string& path, const std::string& ref);

    /**
     * @brief Full object name of a revision.
     */
    std::string resolveCommitish(const std::string& commitish);

    bool validateCommit(const std::string& commitish);

    void clearCaches();

private:
    /// (ref, path); kept apart because refs may contain ':'.
    using GeneratedKey = std::pair<std::string, std::string>;

    struct GeneratedKeyHash {
        size_t operator()(const GeneratedKey& key) const {
            size_t seed = std::hash<std::string>()(key.first);
            return seed ^ (std::hash<std::string>()(key.second) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
        }
    };

    std::shared_ptr<GitExecutor> m_git;
    ParserOptions m_options;
    TtlCache<GeneratedKey, GeneratedStatus, GeneratedKeyHash> m_generated_cache;
};

} // namespace DiffLens
