// =================================================================
// src/DiffLens/WatchMode.cpp
// =================================================================
// Implementation of the per-mode watch table.

#include "DiffLens/WatchMode.hpp"
#include <stdexcept>

namespace DiffLens {

namespace {

const std::vector<std::string> kGitObjectIgnores = {".git/objects/**", ".git/refs/**"};

std::vector<std::string> defaultIgnores() {
    std::vector<std::string> globs = kGitObjectIgnores;
    globs.push_back("node_modules/**");
    return globs;
}

} // namespace

std::string toString(DiffMode mode) {
    switch (mode) {
        case DiffMode::DEFAULT: return "default";
        case DiffMode::WORKING: return "working";
        case DiffMode::STAGED: return "staged";
        case DiffMode::DOT: return "dot";
        case DiffMode::SPECIFIC: return "specific";
    }
    return "default";
}

std::string toString(ChangeType type) {
    switch (type) {
        case ChangeType::FILE: return "file";
        case ChangeType::COMMIT: return "commit";
        case ChangeType::STAGING: return "staging";
    }
    return "commit";
}

DiffMode diffModeFromString(const std::string& name) {
    if (name == "default") return DiffMode::DEFAULT;
    if (name == "working") return DiffMode::WORKING;
    if (name == "staged") return DiffMode::STAGED;
    if (name == "dot") return DiffMode::DOT;
    if (name == "specific") return DiffMode::SPECIFIC;
    throw std::invalid_argument("Unknown diff mode: " + name);
}

ModeWatchConfig watchConfigFor(DiffMode mode) {
    ModeWatchConfig config;
    switch (mode) {
        case DiffMode::DEFAULT:
            config.watchGitDir = true;
            config.ignoreGlobs = defaultIgnores();
            config.relevantGitFiles = {"HEAD"};
            config.changeType = ChangeType::COMMIT;
            break;
        case DiffMode::WORKING:
            config.watchWorkingTree = true;
            config.watchGitDir = true;
            config.ignoreGlobs = defaultIgnores();
            config.relevantGitFiles = {"HEAD", "index"};
            config.changeType = ChangeType::FILE;
            break;
        case DiffMode::STAGED:
            config.watchGitDir = true;
            config.ignoreGlobs = kGitObjectIgnores;
            config.relevantGitFiles = {"HEAD", "index"};
            config.changeType = ChangeType::STAGING;
            break;
        case DiffMode::DOT:
            config.watchWorkingTree = true;
            config.watchGitDir = true;
            config.ignoreGlobs = defaultIgnores();
            config.ignoreGlobs.push_back(".git/FETCH_HEAD");
            config.ignoreGlobs.push_back(".git/ORIG_HEAD");
            config.ignoreGlobs.push_back(".git/logs/**");
            config.relevantGitFiles = {"HEAD"};
            config.changeType = ChangeType::COMMIT;
            break;
        case DiffMode::SPECIFIC:
            config.changeType = ChangeType::FILE;
            break;
    }
    return config;
}

DiffMode determineDiffMode(const std::string& target, const std::optional<std::string>& compare_with) {
    if (compare_with && target != "HEAD" && target != ".") {
        return DiffMode::SPECIFIC;
    }
    if (target == "working") return DiffMode::WORKING;
    if (target == "staged") return DiffMode::STAGED;
    if (target == ".") return DiffMode::DOT;
    return DiffMode::DEFAULT;
}

} // namespace DiffLens
