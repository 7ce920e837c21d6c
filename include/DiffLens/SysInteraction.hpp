// =================================================================
// include/DiffLens/SysInteraction.hpp
// =================================================================
// Filesystem helpers shared by the parser and the watcher.

#pragma once

#include <string>

namespace DiffLens {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string (binary-safe).
     * @param file_path The path to the file.
     * @param max_bytes Files larger than this are rejected.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    static std::string readFile(const std::string& file_path, size_t max_bytes);

    /**
     * @brief Checks if a file exists.
     */
    static bool fileExists(const std::string& file_path);
};

} // namespace DiffLens
