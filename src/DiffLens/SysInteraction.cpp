// =================================================================
// src/DiffLens/SysInteraction.cpp
// =================================================================
// Implementation for filesystem helpers.

#include "DiffLens/SysInteraction.hpp"
#include "DiffLens/GitExecutor.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

namespace DiffLens {

std::string SysInteraction::readFile(const std::string& file_path, size_t max_bytes) {
    struct stat buffer;
    if (stat(file_path.c_str(), &buffer) == 0 && static_cast<size_t>(buffer.st_size) > max_bytes) {
        throw GitOutputTooLargeError("File " + file_path + " exceeds " +
                                     std::to_string(max_bytes) + " bytes");
    }

    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream content;
    content << file_stream.rdbuf();
    return content.str();
}

bool SysInteraction::fileExists(const std::string& file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

} // namespace DiffLens
