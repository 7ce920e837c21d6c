// =================================================================
// src/DiffLens/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "DiffLens/Core.hpp"
#include "DiffLens/ChangeWatcher.hpp"
#include "DiffLens/DiffParser.hpp"
#include "DiffLens/DiffServer.hpp"
#include "DiffLens/GitExecutor.hpp"
#include "DiffLens/Logger.hpp"
#include "DiffLens/RevisionSpec.hpp"
#include "DiffLens/WatchMode.hpp"
#include <filesystem>
#include <iostream>
#include <iterator>

namespace DiffLens {

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_config(std::make_unique<ConfigParser>(commands.config_path))
{
    initializeLogging();
}

Core::~Core() {
    // The server references the watcher, so it goes first.
    m_server.reset();
    m_watcher.reset();
}

void Core::initializeLogging() {
    const DiffLensConfig& config = m_config->getConfig();
    auto& logger = Logger::getInstance();
    logger.initialize(config.logDirectory, config.maxLogFileBytes, config.maxLogFiles);
    logger.setConsoleLogLevel(Logger::levelFromString(config.consoleLogLevel));
}

std::string Core::readStdinPatch() const {
    std::string patch((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    return patch;
}

int Core::run() {
    const DiffLensConfig& config = m_config->getConfig();
    std::string repo_path = std::filesystem::current_path().string();

    ServerOptions server_options;
    server_options.host = m_commands.host.value_or(config.host);
    server_options.port = m_commands.port.value_or(config.port);
    server_options.ignoreWhitespace = m_commands.ignore_whitespace;

    if (m_commands.readsStdin()) {
        server_options.stdinPatch = readStdinPatch();
        server_options.target = "stdin";
        server_options.base = "stdin";
    } else {
        server_options.target = m_commands.commit;
        server_options.base = m_commands.compare_with.value_or(CliParser::defaultBase(m_commands.commit));

        ValidationResult validation = validateDiffArguments(server_options.target, server_options.base);
        if (!validation.valid) {
            std::cerr << "Error: " << validation.error << std::endl;
            return 1;
        }

        // Blob paths in a diff are relative to the top level, not the cwd.
        try {
            std::string toplevel = ProcessGitExecutor(repo_path, config.maxBufferBytes).run({"rev-parse", "--show-toplevel"});
            while (!toplevel.empty() && (toplevel.back() == '\n' || toplevel.back() == '\r')) {
                toplevel.pop_back();
            }
            if (!toplevel.empty()) {
                repo_path = toplevel;
            }
        } catch (const GitError& e) {
            std::cerr << "Error: " << repo_path << " is not inside a git repository: " << e.what() << std::endl;
            return 1;
        }
    }

    auto git = std::make_shared<ProcessGitExecutor>(repo_path, config.maxBufferBytes);

    ParserOptions parser_options;
    parser_options.strict = config.strictParsing;
    parser_options.generatedStatusTtl = std::chrono::seconds(config.generatedStatusTtlSeconds);
    parser_options.maxBlobBytes = config.maxBufferBytes;
    m_parser = std::make_shared<DiffParser>(git, parser_options);

    bool watch = config.watchEnabled && !m_commands.no_watch && !m_commands.readsStdin();
    if (watch) {
        m_watcher = std::make_unique<ChangeWatcher>(git, std::make_unique<InotifyWatchBackend>());
        m_watcher->setExtraIgnores(config.extraIgnore);
    }

    m_server = std::make_unique<DiffServer>(m_parser, m_watcher.get(), server_options);

    try {
        DiffResponse initial = m_server->loadInitialDiff();
        std::cout << "[INFO] Reviewing: " << initial.commit << std::endl;
        if (initial.isEmpty) {
            std::cout << "[INFO] No differences found." << std::endl;
        } else {
            std::cout << "[INFO] " << initial.files.size() << " files changed" << std::endl;
        }
    } catch (const DiffError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        m_server->bind();
    } catch (const ServerError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (m_watcher) {
        DiffMode mode = determineDiffMode(m_commands.commit, m_commands.compare_with);
        DiffServer* server = m_server.get();
        std::shared_ptr<DiffParser> parser = m_parser;
        m_watcher->start(mode, repo_path, std::chrono::milliseconds(config.debounceMs),
                         [server, parser]() {
                             server->invalidateCache();
                             parser->clearCaches();
                         });
    }

    std::cout << "[INFO] DiffLens server started on http://" << server_options.host << ":"
              << m_server->port() << std::endl;

    try {
        m_server->listen();
    } catch (const ServerError& e) {
        LOG_ERROR("Core", e.what());
        if (m_watcher) {
            m_watcher->stop();
        }
        return 1;
    }

    if (m_watcher) {
        m_watcher->stop();
    }
    return 0;
}

} // namespace DiffLens
