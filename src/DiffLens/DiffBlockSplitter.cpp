// =================================================================
// src/DiffLens/DiffBlockSplitter.cpp
// =================================================================
// Implementation of block splitting and path/status resolution.

#include "DiffLens/DiffBlockSplitter.hpp"
#include "DiffLens/ChunkParser.hpp"
#include "DiffLens/FileClassifier.hpp"
#include "DiffLens/PathCodec.hpp"

namespace DiffLens {

namespace {

const std::string kDiffHeader = "diff --git ";

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Metadata lines sit between the "diff --git" line and the first hunk.
struct BlockHeader {
    const std::string* minusLine = nullptr;
    const std::string* plusLine = nullptr;
    const std::string* renameFromLine = nullptr;
    const std::string* renameToLine = nullptr;
    bool newFileMode = false;
    bool deletedFileMode = false;
    bool binaryBody = false;
};

BlockHeader scanBlockHeader(const std::vector<std::string>& lines) {
    BlockHeader header;
    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (startsWith(line, "@@")) {
            break;
        }
        if (!header.minusLine && startsWith(line, "--- ")) {
            header.minusLine = &line;
        } else if (!header.plusLine && startsWith(line, "+++ ")) {
            header.plusLine = &line;
        } else if (!header.renameFromLine && startsWith(line, "rename from ")) {
            header.renameFromLine = &line;
        } else if (!header.renameToLine && startsWith(line, "rename to ")) {
            header.renameToLine = &line;
        } else if (startsWith(line, "new file mode")) {
            header.newFileMode = true;
        } else if (startsWith(line, "deleted file mode")) {
            header.deletedFileMode = true;
        } else if ((startsWith(line, "Binary files ") && endsWith(line, " differ")) ||
                   line == "GIT binary patch") {
            header.binaryBody = true;
        }
    }
    return header;
}

std::optional<std::string> pathFromLine(const std::string* line, const std::string& prefix) {
    if (!line) {
        return std::nullopt;
    }
    return decodeGitPath(line->substr(prefix.size()));
}

bool isDevNullLine(const std::string* line, const std::string& prefix) {
    return line && !pathFromLine(line, prefix);
}

std::vector<std::string> tokenizeHeader(const std::string& raw) {
    std::vector<std::string> segments;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        bool escaped = i > 0 && raw[i - 1] == '\\';

        if (c == '"' && !escaped) {
            in_quotes = !in_quotes;
            current += c;
            continue;
        }
        if (c == ' ' && !in_quotes && !escaped) {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
            continue;
        }
        current += c;
    }

    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

} // namespace

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::vector<std::string> splitDiffBlocks(const std::string& text) {
    std::vector<size_t> starts;
    size_t line_start = 0;
    while (line_start < text.size()) {
        if (text.compare(line_start, kDiffHeader.size(), kDiffHeader) == 0) {
            starts.push_back(line_start);
        }
        size_t newline = text.find('\n', line_start);
        if (newline == std::string::npos) {
            break;
        }
        line_start = newline + 1;
    }

    std::vector<std::string> blocks;
    blocks.reserve(starts.size());
    for (size_t i = 0; i < starts.size(); ++i) {
        size_t end = i + 1 < starts.size() ? starts[i + 1] : text.size();
        blocks.push_back(text.substr(starts[i], end - starts[i]));
    }
    return blocks;
}

std::optional<HeaderPaths> parseDiffHeaderPaths(const std::string& header_line) {
    if (!startsWith(header_line, kDiffHeader)) {
        return std::nullopt;
    }

    std::string raw = header_line.substr(kDiffHeader.size());
    std::vector<std::string> segments = tokenizeHeader(raw);

    if (segments.size() == 2) {
        return HeaderPaths{decodeGitPath(segments[0]), decodeGitPath(segments[1])};
    }

    // Unquoted paths containing spaces: git only writes these when both
    // sides name the same file, so the separator is the middle space.
    if (raw.find('"') == std::string::npos && raw.size() % 2 == 1) {
        size_t mid = raw.size() / 2;
        if (raw[mid] == ' ') {
            auto old_path = decodeGitPath(raw.substr(0, mid));
            auto new_path = decodeGitPath(raw.substr(mid + 1));
            if (old_path && new_path && *old_path == *new_path) {
                return HeaderPaths{old_path, new_path};
            }
        }
    }
    return std::nullopt;
}

std::vector<FileSummary> parseNumstat(const std::string& output) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start < output.size()) {
        size_t end = output.find('\0', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        tokens.push_back(output.substr(start, end - start));
        start = end + 1;
    }

    std::vector<FileSummary> summaries;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& record = tokens[i];
        size_t first_tab = record.find('\t');
        size_t second_tab = first_tab == std::string::npos ? std::string::npos : record.find('\t', first_tab + 1);
        if (second_tab == std::string::npos) {
            continue;
        }

        FileSummary summary;
        std::string insertions = record.substr(0, first_tab);
        std::string deletions = record.substr(first_tab + 1, second_tab - first_tab - 1);
        if (insertions == "-" && deletions == "-") {
            summary.binary = true;
        } else {
            try {
                summary.insertions = std::stoul(insertions);
                summary.deletions = std::stoul(deletions);
            } catch (const std::logic_error&) {
                continue;
            }
        }

        std::string path = record.substr(second_tab + 1);
        if (path.empty()) {
            // Rename or copy: source and destination follow as separate fields.
            if (i + 2 >= tokens.size()) {
                break;
            }
            summary.from = tokens[i + 1];
            summary.file = tokens[i + 2];
            i += 2;
        } else {
            summary.file = path;
        }
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

std::optional<DiffFile> parseFileBlock(const std::string& block, const FileSummary* summary) {
    std::vector<std::string> lines = splitLines(block);
    auto header_paths = parseDiffHeaderPaths(lines.front());
    BlockHeader header = scanBlockHeader(lines);

    auto plus_path = pathFromLine(header.plusLine, "+++ ");
    auto minus_path = pathFromLine(header.minusLine, "--- ");
    auto rename_from = pathFromLine(header.renameFromLine, "rename from ");
    auto rename_to = pathFromLine(header.renameToLine, "rename to ");

    std::optional<std::string> summary_new;
    std::optional<std::string> summary_old;
    if (summary) {
        summary_new = unquoteGitPath(summary->file);
        if (summary->from) {
            summary_old = unquoteGitPath(*summary->from);
        }
    }

    std::optional<std::string> new_path = rename_to;
    if (!new_path) new_path = plus_path;
    if (!new_path && header_paths) new_path = header_paths->newPath;
    if (!new_path) new_path = summary_new;

    if (!new_path) {
        return std::nullopt;
    }

    std::optional<std::string> old_path = rename_from;
    if (!old_path) old_path = minus_path;
    if (!old_path && header_paths) old_path = header_paths->oldPath;
    if (!old_path) old_path = summary_old;
    if (!old_path) old_path = new_path;

    DiffFile file;
    file.path = *new_path;

    if (header.newFileMode || isDevNullLine(header.minusLine, "--- ")) {
        file.status = FileStatus::ADDED;
    } else if (header.deletedFileMode || isDevNullLine(header.plusLine, "+++ ")) {
        file.status = FileStatus::DELETED;
    } else if (*old_path != *new_path) {
        file.status = FileStatus::RENAMED;
        file.oldPath = *old_path;
    } else {
        file.status = FileStatus::MODIFIED;
    }

    file.isGenerated = isGeneratedPath(file.path);

    bool binary = header.binaryBody || (summary && summary->binary);
    if (binary) {
        return file;
    }

    file.chunks = parseChunks(lines);
    if (summary) {
        file.additions = summary->insertions;
        file.deletions = summary->deletions;
    } else {
        LineCounts counts = countLines(file.chunks);
        file.additions = counts.additions;
        file.deletions = counts.deletions;
    }
    return file;
}

} // namespace DiffLens
