// =================================================================
// include/DiffLens/ConfigParser.hpp
// =================================================================
// Loads the .difflens/config.yml file.

#pragma once

#include <string>
#include <vector>

namespace DiffLens {

/**
 * @brief All settings, initialized to their defaults.
 */
struct DiffLensConfig {
    std::string host = "localhost";
    int port = 4966;

    bool watchEnabled = true;
    int debounceMs = 300;
    std::vector<std::string> extraIgnore;

    size_t maxBufferBytes = 10 * 1024 * 1024;

    bool strictParsing = false;
    int generatedStatusTtlSeconds = 60;

    std::string logDirectory = ".difflens/logs";
    std::string consoleLogLevel = "info";
    size_t maxLogFileBytes = 10 * 1024 * 1024;
    size_t maxLogFiles = 5;
};

class ConfigParser {
public:
    static constexpr const char* DEFAULT_PATH = ".difflens/config.yml";

    /**
     * @brief Constructs the parser and loads the configuration file.
     *
     * A missing file leaves every setting at its default. A malformed file
     * is logged and also yields defaults; a single bad value only resets
     * that key.
     *
     * @param config_path The path to the config.yml file.
     */
    explicit ConfigParser(const std::string& config_path);

    const DiffLensConfig& getConfig() const { return m_config; }

    /**
     * @brief True if the file existed and parsed.
     */
    bool isLoaded() const { return m_loaded; }

    /**
     * @brief Parses YAML text on top of the defaults.
     */
    static DiffLensConfig parseString(const std::string& yaml_text);

private:
    DiffLensConfig m_config;
    bool m_loaded = false;
};

} // namespace DiffLens
