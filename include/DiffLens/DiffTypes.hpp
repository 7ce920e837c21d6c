// =================================================================
// include/DiffLens/DiffTypes.hpp
// =================================================================
// Data model produced by the diff parser and served to the UI.

#pragma once

#include "nlohmann/json.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace DiffLens {

enum class LineType {
    ADD,
    DELETE,
    NORMAL
};

enum class FileStatus {
    ADDED,
    DELETED,
    MODIFIED,
    RENAMED
};

enum class GeneratedSource {
    PATH,
    CONTENT
};

/**
 * @brief A single line inside a hunk.
 *
 * oldLineNumber is absent for additions, newLineNumber is absent for deletions.
 */
struct DiffLine {
    LineType type = LineType::NORMAL;
    std::string content;
    std::optional<size_t> oldLineNumber;
    std::optional<size_t> newLineNumber;
};

struct DiffChunk {
    std::string header;
    size_t oldStart = 0;
    size_t oldLines = 0;
    size_t newStart = 0;
    size_t newLines = 0;
    std::vector<DiffLine> lines;
};

/**
 * @brief One file of a diff.
 *
 * oldPath is set only for renames whose two paths differ. Binary files
 * carry no chunks and zero counts.
 */
struct DiffFile {
    std::string path;
    std::optional<std::string> oldPath;
    FileStatus status = FileStatus::MODIFIED;
    size_t additions = 0;
    size_t deletions = 0;
    std::vector<DiffChunk> chunks;
    bool isGenerated = false;
};

struct DiffResponse {
    std::string commit;
    std::vector<DiffFile> files;
    bool isEmpty = true;
};

struct GeneratedStatus {
    bool isGenerated = false;
    GeneratedSource source = GeneratedSource::PATH;

    bool operator==(const GeneratedStatus& other) const {
        return isGenerated == other.isGenerated && source == other.source;
    }
};

/**
 * @brief Raised when a revision range cannot be turned into a diff.
 */
class DiffError : public std::runtime_error {
public:
    explicit DiffError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Raised in strict mode when a file block has no resolvable path.
 */
class DiffParseError : public DiffError {
public:
    explicit DiffParseError(const std::string& message) : DiffError(message) {}
};

std::string toString(LineType type);
std::string toString(FileStatus status);
std::string toString(GeneratedSource source);

void to_json(nlohmann::json& j, const DiffLine& line);
void to_json(nlohmann::json& j, const DiffChunk& chunk);
void to_json(nlohmann::json& j, const DiffFile& file);
void to_json(nlohmann::json& j, const DiffResponse& response);
void to_json(nlohmann::json& j, const GeneratedStatus& status);

} // namespace DiffLens
