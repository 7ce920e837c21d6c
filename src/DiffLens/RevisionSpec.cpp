// =================================================================
// src/DiffLens/RevisionSpec.cpp
// =================================================================
// Implementation of revision argument validation.

#include "DiffLens/RevisionSpec.hpp"
#include <algorithm>
#include <array>
#include <regex>
#include <sstream>

namespace DiffLens {

namespace {

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isValidBranchName(const std::string& name) {
    if (name.front() == '-') return false;
    if (name.back() == '.') return false;
    if (name.find("..") != std::string::npos) return false;
    if (name.find("@{") != std::string::npos) return false;
    if (name.find("//") != std::string::npos) return false;
    if (name.front() == '/' || name.back() == '/') return false;
    if (endsWith(name, ".lock")) return false;

    for (unsigned char c : name) {
        if (c <= 0x20 || c == 0x7f || c == '~' || c == '^' || c == ':' ||
            c == '?' || c == '*' || c == '[' || c == '\\') {
            return false;
        }
    }

    std::stringstream components(name);
    std::string component;
    while (std::getline(components, component, '/')) {
        if (component.empty() || component.front() == '.' || endsWith(component, ".lock")) {
            return false;
        }
    }
    return true;
}

} // namespace

bool isSpecialRevision(const std::string& revision) {
    return revision == "working" || revision == "staged" || revision == ".";
}

bool validateCommitish(const std::string& commitish) {
    auto first = commitish.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return false;
    }
    auto last = commitish.find_last_not_of(" \t\r\n");
    std::string trimmed = commitish.substr(first, last - first + 1);

    if (trimmed == "HEAD~") {
        return false;
    }
    if (isSpecialRevision(trimmed)) {
        return true;
    }

    static const std::array<std::regex, 5> valid_patterns = {
        std::regex("^[a-f0-9]{4,40}$", std::regex::icase),
        std::regex("^[a-f0-9]{4,40}\\^+$", std::regex::icase),
        std::regex("^[a-f0-9]{4,40}~\\d+$", std::regex::icase),
        std::regex("^HEAD(~\\d+|\\^\\d*)*$"),
        std::regex("^@(~\\d+|\\^\\d*)*$")
    };

    bool matches = std::any_of(valid_patterns.begin(), valid_patterns.end(),
        [&trimmed](const std::regex& pattern) { return std::regex_match(trimmed, pattern); });
    if (matches) {
        return true;
    }

    // Branch names may carry ancestry suffixes, e.g. "main^" or "feature~2".
    static const std::regex ancestry_suffix("^(.+?)((~\\d*|\\^\\d*)+)$");
    std::smatch match;
    if (std::regex_match(trimmed, match, ancestry_suffix)) {
        return isValidBranchName(match[1].str());
    }

    return isValidBranchName(trimmed);
}

ValidationResult validateDiffArguments(const std::string& target,
                                       const std::optional<std::string>& base) {
    if (!validateCommitish(target)) {
        return {false, "Invalid target commit-ish format"};
    }
    if (base && !validateCommitish(*base)) {
        return {false, "Invalid base commit-ish format"};
    }

    if (base && isSpecialRevision(*base) && !(*base == "staged" && target == "working")) {
        return {false, "Special arguments (working, staged, .) are only allowed as target, not base. Got base: " + *base};
    }

    if (base && target == *base) {
        return {false, "Cannot compare " + target + " with itself"};
    }

    if (target == "working" && base && *base != "staged") {
        return {false, "\"working\" shows unstaged changes and cannot be compared with another commit. "
                       "Use \".\" instead to compare all uncommitted changes with a specific commit."};
    }

    return {};
}

std::string shortHash(const std::string& hash) {
    return hash.substr(0, 7);
}

std::string commitRangeLabel(const std::string& base, const std::string& target) {
    return base + "..." + target;
}

} // namespace DiffLens
