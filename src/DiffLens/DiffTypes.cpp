// =================================================================
// src/DiffLens/DiffTypes.cpp
// =================================================================
// String conversions and JSON serialization for the diff model.

#include "DiffLens/DiffTypes.hpp"

namespace DiffLens {

std::string toString(LineType type) {
    switch (type) {
        case LineType::ADD: return "add";
        case LineType::DELETE: return "delete";
        case LineType::NORMAL: return "normal";
    }
    return "normal";
}

std::string toString(FileStatus status) {
    switch (status) {
        case FileStatus::ADDED: return "added";
        case FileStatus::DELETED: return "deleted";
        case FileStatus::MODIFIED: return "modified";
        case FileStatus::RENAMED: return "renamed";
    }
    return "modified";
}

std::string toString(GeneratedSource source) {
    return source == GeneratedSource::CONTENT ? "content" : "path";
}

void to_json(nlohmann::json& j, const DiffLine& line) {
    j = nlohmann::json{{"type", toString(line.type)}, {"content", line.content}};
    if (line.oldLineNumber) {
        j["oldLineNumber"] = *line.oldLineNumber;
    }
    if (line.newLineNumber) {
        j["newLineNumber"] = *line.newLineNumber;
    }
}

void to_json(nlohmann::json& j, const DiffChunk& chunk) {
    j = nlohmann::json{
        {"header", chunk.header},
        {"oldStart", chunk.oldStart},
        {"oldLines", chunk.oldLines},
        {"newStart", chunk.newStart},
        {"newLines", chunk.newLines},
        {"lines", chunk.lines}
    };
}

void to_json(nlohmann::json& j, const DiffFile& file) {
    j = nlohmann::json{
        {"path", file.path},
        {"status", toString(file.status)},
        {"additions", file.additions},
        {"deletions", file.deletions},
        {"chunks", file.chunks},
        {"isGenerated", file.isGenerated}
    };
    if (file.oldPath) {
        j["oldPath"] = *file.oldPath;
    }
}

void to_json(nlohmann::json& j, const DiffResponse& response) {
    j = nlohmann::json{
        {"commit", response.commit},
        {"files", response.files},
        {"isEmpty", response.isEmpty}
    };
}

void to_json(nlohmann::json& j, const GeneratedStatus& status) {
    j = nlohmann::json{{"isGenerated", status.isGenerated}, {"source", toString(status.source)}};
}

} // namespace DiffLens
