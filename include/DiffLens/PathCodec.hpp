// =================================================================
// include/DiffLens/PathCodec.hpp
// =================================================================
// Decoding of the path tokens git writes into diff headers.

#pragma once

#include <optional>
#include <string>

namespace DiffLens {

/**
 * @brief Decodes a raw git path token into a filesystem path.
 *
 * Handles, in order: a trailing tab and anything after it, surrounding
 * double quotes, one anchored diff prefix (a/, b/, c/, i/, w/) and C-style
 * backslash escapes including 1-3 digit octal byte escapes. The decoded
 * bytes are returned as-is (git writes UTF-8).
 *
 * @param raw Token as found after "diff --git ", "--- ", "+++ ",
 *            "rename from " or "rename to ".
 * @return The path, or std::nullopt for /dev/null.
 */
std::optional<std::string> decodeGitPath(const std::string& raw);

/**
 * @brief Decodes quoting and escapes without stripping a diff prefix.
 *
 * For paths that git prints without a/ b/ prefixes, such as the records of
 * "git diff --numstat -z". unquoteGitPath("\"a/test\\040file.py\"")
 * yields "a/test file.py".
 *
 * @return The path, or std::nullopt for /dev/null.
 */
std::optional<std::string> unquoteGitPath(const std::string& raw);

} // namespace DiffLens
