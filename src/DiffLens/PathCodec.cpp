// =================================================================
// src/DiffLens/PathCodec.cpp
// =================================================================
// Implementation of git path decoding.

#include "DiffLens/PathCodec.hpp"

namespace DiffLens {

namespace {

const char* const kDevNull = "/dev/null";

bool isOctalDigit(char c) {
    return c >= '0' && c <= '7';
}

// Maps the character after a backslash to its byte, or -1 if it has no
// fixed mapping (the character is then taken literally).
int escapedByte(char c) {
    switch (c) {
        case 't': return 0x09;
        case 'n': return 0x0a;
        case 'r': return 0x0d;
        case 'b': return 0x08;
        case 'f': return 0x0c;
        case 'v': return 0x0b;
        case 'a': return 0x07;
        case '\\': return 0x5c;
        case '"': return 0x22;
        case ' ': return 0x20;
        default: return -1;
    }
}

std::string stripDiffPrefix(const std::string& path) {
    if (path.size() >= 2 && path[1] == '/') {
        switch (path[0]) {
            case 'a':
            case 'b':
            case 'c':
            case 'i':
            case 'w':
                return path.substr(2);
            default:
                break;
        }
    }
    return path;
}

std::string unescape(const std::string& text) {
    std::string bytes;
    bytes.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c != '\\' || i + 1 >= text.size()) {
            bytes.push_back(c);
            continue;
        }

        char next = text[i + 1];
        if (isOctalDigit(next)) {
            int value = 0;
            size_t read = 0;
            while (read < 3 && i + 1 + read < text.size() && isOctalDigit(text[i + 1 + read])) {
                value = value * 8 + (text[i + 1 + read] - '0');
                ++read;
            }
            bytes.push_back(static_cast<char>(value & 0xff));
            i += read;
            continue;
        }

        int mapped = escapedByte(next);
        bytes.push_back(mapped >= 0 ? static_cast<char>(mapped) : next);
        ++i;
    }

    return bytes;
}

std::string stripQuoting(const std::string& raw) {
    std::string working = raw;

    size_t tab = working.find('\t');
    if (tab != std::string::npos) {
        working.erase(tab);
    }

    if (working.size() >= 2 && working.front() == '"' && working.back() == '"') {
        working = working.substr(1, working.size() - 2);
    }
    return working;
}

} // namespace

std::optional<std::string> decodeGitPath(const std::string& raw) {
    std::string working = stripDiffPrefix(stripQuoting(raw));
    if (working == kDevNull) {
        return std::nullopt;
    }
    return unescape(working);
}

std::optional<std::string> unquoteGitPath(const std::string& raw) {
    std::string working = stripQuoting(raw);
    if (working == kDevNull) {
        return std::nullopt;
    }
    return unescape(working);
}

} // namespace DiffLens
