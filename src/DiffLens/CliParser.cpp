// =================================================================
// src/DiffLens/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "DiffLens/CliParser.hpp"
#include "DiffLens/ConfigParser.hpp"

namespace DiffLens {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("DiffLens: a local web viewer for git diffs that reloads as the repository changes.");

    m_app->add_option("commit", m_commands.commit,
        "Revision to review: a commit-ish, 'working', 'staged', '.', or '-' to read a patch from stdin")
        ->capture_default_str();
    auto* compare_opt = m_app->add_option("compare-with", m_compare_with,
        "Revision to compare against (defaults depend on the reviewed revision)");
    auto* port_opt = m_app->add_option("-p,--port", m_port, "Port for the HTTP server")
        ->check(CLI::Range(1, 65535));
    auto* host_opt = m_app->add_option("--host", m_host, "Host interface to bind");
    m_app->add_flag("--no-watch", m_commands.no_watch, "Do not watch the repository for changes");
    m_app->add_flag("-w,--ignore-whitespace", m_commands.ignore_whitespace, "Ignore whitespace changes");
    m_commands.config_path = ConfigParser::DEFAULT_PATH;
    m_app->add_option("-c,--config", m_commands.config_path, "Path to the configuration file")
        ->capture_default_str();

    m_app->callback([this, compare_opt, port_opt, host_opt]() {
        if (compare_opt->count() > 0) {
            m_commands.compare_with = m_compare_with;
        }
        if (port_opt->count() > 0) {
            m_commands.port = m_port;
        }
        if (host_opt->count() > 0) {
            m_commands.host = m_host;
        }
    });

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

std::string CliParser::defaultBase(const std::string& commit) {
    if (commit == "working") {
        return "staged";
    }
    if (commit == "staged" || commit == ".") {
        return "HEAD";
    }
    return commit + "^";
}

} // namespace DiffLens
