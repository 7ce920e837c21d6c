// =================================================================
// src/DiffLens/DiffParser.cpp
// =================================================================
// Implementation of the diff parser.

#include "DiffLens/DiffParser.hpp"
#include "DiffLens/FileClassifier.hpp"
#include "DiffLens/Logger.hpp"
#include "DiffLens/RevisionSpec.hpp"
#include "DiffLens/SysInteraction.hpp"
#include <algorithm>
#include <filesystem>

namespace DiffLens {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

} // namespace

DiffParser::DiffParser(std::shared_ptr<GitExecutor> git, ParserOptions options)
    : m_git(std::move(git)),
      m_options(options),
      m_generated_cache(options.generatedStatusTtl) {}

DiffResponse DiffParser::parseDiff(const std::string& target, const std::string& base,
                                   bool ignore_whitespace) {
    auto start = std::chrono::steady_clock::now();
    std::string failure = "Failed to parse diff for " + target + " vs " + base + ": ";

    try {
        ValidationResult validation = validateDiffArguments(target, base);
        if (!validation.valid) {
            throw DiffError(validation.error);
        }

        std::string label;
        std::vector<std::string> diff_args;

        if (target == "working") {
            label = "Working Directory (unstaged changes)";
        } else if (target == "staged") {
            label = shortHash(resolveCommitish(base)) + " vs Staging Area (staged changes)";
            diff_args = {"--cached", base};
        } else if (target == ".") {
            label = shortHash(resolveCommitish(base)) + " vs Working Directory (all uncommitted changes)";
            diff_args = {base};
        } else {
            std::string target_hash = resolveCommitish(target);
            std::string base_hash = resolveCommitish(base);
            label = commitRangeLabel(shortHash(base_hash), shortHash(target_hash));
            diff_args = {label};
        }

        if (ignore_whitespace) {
            diff_args.push_back("-w");
        }
        diff_args.push_back("--no-ext-diff");
        diff_args.push_back("--color=never");

        std::vector<std::string> numstat_args = {"diff", "--numstat", "-z"};
        numstat_args.insert(numstat_args.end(), diff_args.begin(), diff_args.end());
        std::vector<std::string> raw_args = {"diff"};
        raw_args.insert(raw_args.end(), diff_args.begin(), diff_args.end());

        std::vector<FileSummary> summaries = parseNumstat(m_git->run(numstat_args));
        std::string raw_diff = m_git->run(raw_args);

        DiffResponse response;
        response.commit = label;
        response.files = parseUnifiedDiff(raw_diff, summaries);
        response.isEmpty = response.files.empty();

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        Logger::getInstance().logDiffParsed(label, response.files.size(), duration.count());
        return response;
    } catch (const DiffParseError& e) {
        throw DiffParseError(failure + e.what());
    } catch (const std::exception& e) {
        throw DiffError(failure + e.what());
    }
}

DiffResponse DiffParser::parsePatch(const std::string& raw_diff) const {
    DiffResponse response;
    response.commit = "stdin diff";
    response.files = parseUnifiedDiff(raw_diff, {});
    response.isEmpty = response.files.empty();
    return response;
}

std::vector<DiffFile> DiffParser::parseUnifiedDiff(const std::string& diff_text,
                                                   const std::vector<FileSummary>& summaries) const {
    std::vector<DiffFile> files;
    std::vector<std::string> blocks = splitDiffBlocks(diff_text);

    for (size_t i = 0; i < blocks.size(); ++i) {
        const FileSummary* summary = i < summaries.size() ? &summaries[i] : nullptr;
        auto file = parseFileBlock(blocks[i], summary);
        if (file) {
            files.push_back(std::move(*file));
            continue;
        }

        std::string header = blocks[i].substr(0, blocks[i].find('\n'));
        if (m_options.strict) {
            throw DiffParseError("No file path could be resolved for block: " + header);
        }
        LOG_WARNING("DiffParser", "Dropping block without a resolvable path: " + header);
    }
    return files;
}

GeneratedStatus DiffParser::getGeneratedStatus(const std::string& path, const std::string& ref) {
    GeneratedKey key(ref, path);
    if (auto cached = m_generated_cache.get(key)) {
        return *cached;
    }

    GeneratedStatus status;
    if (isGeneratedPath(path)) {
        status = {true, GeneratedSource::PATH};
    } else {
        try {
            bool marked = hasGeneratedMarker(getBlobContent(path, ref));
            status = {marked, GeneratedSource::CONTENT};
        } catch (const std::exception& e) {
            LOG_DEBUG("DiffParser", "Content check skipped for " + path + " at " + ref + ": " + e.what());
            status = {false, GeneratedSource::PATH};
        }
    }

    m_generated_cache.put(key, status);
    return status;
}

std::string DiffParser::getBlobContent(const std::string& path, const std::string& ref) {
    std::string limit = std::to_string(m_options.maxBlobBytes / (1024 * 1024)) + "MB";
    try {
        if (ref == "working" || ref == ".") {
            std::filesystem::path full_path = std::filesystem::path(m_git->repoPath()) / path;
            return SysInteraction::readFile(full_path.string(), m_options.maxBlobBytes);
        }

        if (ref == "staged") {
            return m_git->run({"show", ":" + path});
        }

        std::string blob_hash = trim(m_git->run({"rev-parse", ref + ":" + path}));
        return m_git->run({"cat-file", "blob", blob_hash});
    } catch (const GitOutputTooLargeError&) {
        throw GitOutputTooLargeError("File " + path + " is too large to display (over " + limit + " limit)");
    } catch (const std::exception& e) {
        throw GitError("Failed to get blob content for " + path + " at " + ref + ": " + e.what());
    }
}

size_t DiffParser::getLineCount(const std::string& path, const std::string& ref) {
    std::string content = getBlobContent(path, ref);
    if (content.empty()) {
        return 0;
    }
    size_t lines = static_cast<size_t>(std::count(content.begin(), content.end(), '\n'));
    return content.back() == '\n' ? lines : lines + 1;
}

std::string DiffParser::resolveCommitish(const std::string& commitish) {
    return trim(m_git->run({"rev-parse", commitish}));
}

bool DiffParser::validateCommit(const std::string& commitish) {
    try {
        if (isSpecialRevision(commitish)) {
            m_git->run({"rev-parse", "--git-dir"});
        } else {
            m_git->run({"cat-file", "-e", commitish + "^{commit}"});
        }
        return true;
    } catch (const GitError& e) {
        LOG_DEBUG("DiffParser", "Invalid revision " + commitish + ": " + e.what());
        return false;
    }
}

void DiffParser::clearCaches() {
    m_generated_cache.clear();
}

} // namespace DiffLens
