// =================================================================
// src/DiffLens/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration loader.

#include "DiffLens/ConfigParser.hpp"
#include "DiffLens/Logger.hpp"
#include "DiffLens/SysInteraction.hpp"
#include <yaml-cpp/yaml.h>

namespace DiffLens {

namespace {

template <typename T>
void readValue(const YAML::Node& section, const std::string& section_name, const std::string& key, T& out) {
    if (!section || !section[key]) {
        return;
    }
    try {
        out = section[key].as<T>();
    } catch (const YAML::BadConversion& e) {
        Logger::getInstance().warning("ConfigParser",
            "Invalid value for " + section_name + "." + key + ", using default", e.what());
    }
}

DiffLensConfig fromNode(const YAML::Node& root) {
    DiffLensConfig config;
    if (!root || !root.IsMap()) {
        return config;
    }

    YAML::Node server = root["server"];
    readValue(server, "server", "host", config.host);
    readValue(server, "server", "port", config.port);

    YAML::Node watch = root["watch"];
    readValue(watch, "watch", "enabled", config.watchEnabled);
    readValue(watch, "watch", "debounce_ms", config.debounceMs);
    readValue(watch, "watch", "extra_ignore", config.extraIgnore);

    YAML::Node git = root["git"];
    readValue(git, "git", "max_buffer_bytes", config.maxBufferBytes);

    YAML::Node parser = root["parser"];
    readValue(parser, "parser", "strict", config.strictParsing);
    readValue(parser, "parser", "generated_status_ttl_seconds", config.generatedStatusTtlSeconds);

    YAML::Node logging = root["logging"];
    readValue(logging, "logging", "directory", config.logDirectory);
    readValue(logging, "logging", "console_level", config.consoleLogLevel);
    readValue(logging, "logging", "max_file_bytes", config.maxLogFileBytes);
    readValue(logging, "logging", "max_files", config.maxLogFiles);

    if (config.debounceMs < 0) {
        Logger::getInstance().warning("ConfigParser", "watch.debounce_ms must not be negative, using 300");
        config.debounceMs = 300;
    }
    return config;
}

} // namespace

ConfigParser::ConfigParser(const std::string& config_path) {
    if (!SysInteraction::fileExists(config_path)) {
        // Defaults apply until a config file is written.
        return;
    }

    try {
        m_config = fromNode(YAML::LoadFile(config_path));
        m_loaded = true;
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("ConfigParser",
            "Failed to parse configuration file " + config_path + ", using defaults", e.what());
        m_config = DiffLensConfig();
    }
}

DiffLensConfig ConfigParser::parseString(const std::string& yaml_text) {
    try {
        return fromNode(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("ConfigParser", "Failed to parse configuration, using defaults", e.what());
        return DiffLensConfig();
    }
}

} // namespace DiffLens
