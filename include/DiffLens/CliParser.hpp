// =================================================================
// include/DiffLens/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <optional>
#include <string>

namespace DiffLens {

// Parsed command-line values. Optional fields are unset when the flag was
// not given, so configuration values can fill them in.
struct Commands {
    std::string commit = "HEAD";
    std::optional<std::string> compare_with;

    std::optional<int> port;
    std::optional<std::string> host;
    bool no_watch = false;
    bool ignore_whitespace = false;
    std::string config_path;

    /// True when commit is "-", meaning a patch is read from stdin.
    bool readsStdin() const { return commit == "-"; }
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and positionals.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

    /**
     * @brief The base compared against when none is given:
     * "staged" for "working", "HEAD" for "staged" and ".", "<commit>^" otherwise.
     */
    static std::string defaultBase(const std::string& commit);

private:
    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;

    std::string m_compare_with;
    int m_port = 0;
    std::string m_host;
};

} // namespace DiffLens
