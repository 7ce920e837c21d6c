// =================================================================
// include/DiffLens/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "DiffLens/CliParser.hpp"
#include "DiffLens/ConfigParser.hpp"
#include <memory>
#include <string>

namespace DiffLens {

class ChangeWatcher;
class DiffParser;
class DiffServer;

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Declared here and defined in the .cpp file because the members
     * hold unique_ptrs to forward-declared types.
     */
    ~Core();

    /**
     * @brief Parses the initial diff, starts the watcher and serves until stopped.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    void initializeLogging();
    std::string readStdinPatch() const;

    const Commands& m_commands;
    std::unique_ptr<ConfigParser> m_config;
    std::shared_ptr<DiffParser> m_parser;
    std::unique_ptr<ChangeWatcher> m_watcher;
    std::unique_ptr<DiffServer> m_server;
};

} // namespace DiffLens
