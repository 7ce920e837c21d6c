// =================================================================
// src/DiffLens/ChunkParser.cpp
// =================================================================
// Implementation of hunk parsing as a fold over the block's lines.

#include "DiffLens/ChunkParser.hpp"
#include <cctype>

namespace DiffLens {

namespace {

// Reads a decimal number at pos, advancing pos past it.
bool readNumber(const std::string& text, size_t& pos, size_t& value) {
    size_t start = pos;
    value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        value = value * 10 + static_cast<size_t>(text[pos] - '0');
        ++pos;
    }
    return pos > start;
}

bool expect(const std::string& text, size_t& pos, const char* literal) {
    for (const char* p = literal; *p; ++p, ++pos) {
        if (pos >= text.size() || text[pos] != *p) {
            return false;
        }
    }
    return true;
}

// Accumulator threaded through the fold.
struct ChunkFold {
    std::vector<DiffChunk> chunks;
    std::optional<DiffChunk> current;
    size_t oldLine = 0;
    size_t newLine = 0;

    void flush() {
        if (current) {
            chunks.push_back(std::move(*current));
            current.reset();
        }
    }
};

ChunkFold step(ChunkFold fold, const std::string& line) {
    if (line.compare(0, 2, "@@") == 0) {
        fold.flush();
        auto header = parseHunkHeader(line);
        if (header) {
            DiffChunk chunk;
            chunk.header = line;
            chunk.oldStart = header->oldStart;
            chunk.oldLines = header->oldLines;
            chunk.newStart = header->newStart;
            chunk.newLines = header->newLines;
            fold.current = std::move(chunk);
            fold.oldLine = header->oldStart;
            fold.newLine = header->newStart;
        }
        return fold;
    }

    if (!fold.current || line.empty()) {
        return fold;
    }

    DiffLine diff_line;
    switch (line[0]) {
        case '+': diff_line.type = LineType::ADD; break;
        case '-': diff_line.type = LineType::DELETE; break;
        case ' ': diff_line.type = LineType::NORMAL; break;
        default: return fold;
    }
    diff_line.content = line.substr(1);

    if (diff_line.type != LineType::ADD) {
        diff_line.oldLineNumber = fold.oldLine++;
    }
    if (diff_line.type != LineType::DELETE) {
        diff_line.newLineNumber = fold.newLine++;
    }

    fold.current->lines.push_back(std::move(diff_line));
    return fold;
}

} // namespace

std::optional<HunkHeader> parseHunkHeader(const std::string& line) {
    HunkHeader header;
    size_t pos = 0;

    if (!expect(line, pos, "@@ -") || !readNumber(line, pos, header.oldStart)) {
        return std::nullopt;
    }
    if (pos < line.size() && line[pos] == ',') {
        ++pos;
        if (!readNumber(line, pos, header.oldLines)) {
            return std::nullopt;
        }
    }
    if (!expect(line, pos, " +") || !readNumber(line, pos, header.newStart)) {
        return std::nullopt;
    }
    if (pos < line.size() && line[pos] == ',') {
        ++pos;
        if (!readNumber(line, pos, header.newLines)) {
            return std::nullopt;
        }
    }
    if (!expect(line, pos, " @@")) {
        return std::nullopt;
    }
    return header;
}

std::vector<DiffChunk> parseChunks(const std::vector<std::string>& lines) {
    ChunkFold fold;
    for (const auto& line : lines) {
        fold = step(std::move(fold), line);
    }
    fold.flush();
    return std::move(fold.chunks);
}

LineCounts countLines(const std::vector<DiffChunk>& chunks) {
    LineCounts counts;
    for (const auto& chunk : chunks) {
        for (const auto& line : chunk.lines) {
            if (line.type == LineType::ADD) {
                counts.additions++;
            } else if (line.type == LineType::DELETE) {
                counts.deletions++;
            }
        }
    }
    return counts;
}

} // namespace DiffLens
