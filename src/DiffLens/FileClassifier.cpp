// =================================================================
// src/DiffLens/FileClassifier.cpp
// =================================================================
// Implementation of generated-file classification.

#include "DiffLens/FileClassifier.hpp"
#include <algorithm>
#include <array>

namespace DiffLens {

namespace {

const std::array<const char*, 13> kGeneratedBasenames = {
    "package-lock.json",
    "npm-shrinkwrap.json",
    "yarn.lock",
    "pnpm-lock.yaml",
    "bun.lockb",
    "Cargo.lock",
    "Gemfile.lock",
    "poetry.lock",
    "composer.lock",
    "Pipfile.lock",
    "go.sum",
    "pubspec.lock",
    "flake.lock"
};

const std::array<const char*, 4> kGeneratedSuffixes = {
    ".lock",
    ".min.js",
    ".min.css",
    ".map"
};

const std::array<const char*, 3> kGeneratedMarkers = {
    "@generated",
    "Code generated",
    "<auto-generated"
};

// Markers are only honoured near the top of the file.
const size_t kMarkerScanBytes = 8192;

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool isGeneratedPath(const std::string& path) {
    size_t slash = path.find_last_of('/');
    std::string basename = slash == std::string::npos ? path : path.substr(slash + 1);

    bool known_name = std::any_of(kGeneratedBasenames.begin(), kGeneratedBasenames.end(),
        [&basename](const char* name) { return basename == name; });
    if (known_name) {
        return true;
    }

    return std::any_of(kGeneratedSuffixes.begin(), kGeneratedSuffixes.end(),
        [&basename](const char* suffix) { return endsWith(basename, suffix); });
}

bool hasGeneratedMarker(const std::string& content) {
    std::string head = content.substr(0, std::min(content.size(), kMarkerScanBytes));
    return std::any_of(kGeneratedMarkers.begin(), kGeneratedMarkers.end(),
        [&head](const char* marker) { return head.find(marker) != std::string::npos; });
}

} // namespace DiffLens
