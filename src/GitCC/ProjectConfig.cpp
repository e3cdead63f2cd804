// =================================================================
// src/GitCC/ProjectConfig.cpp
// =================================================================
// Implementation for the .git-cc.yaml loader.

#include "GitCC/ProjectConfig.hpp"
#include "GitCC/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace GitCC {

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, (last - first + 1));
}

// Sequences are taken element by element, a plain scalar is split like an env value
static bool readStringList(const YAML::Node& node, const std::string& key,
                           std::vector<std::string>& target) {
    if (!node || node.IsNull()) {
        return false;
    }

    try {
        if (node.IsSequence()) {
            std::vector<std::string> values;
            for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
                std::string value = trim(it->as<std::string>());
                if (!value.empty()) {
                    values.push_back(value);
                }
            }
            target = values;
            return true;
        }
        if (node.IsScalar()) {
            target = ConfigParser::splitList(node.as<std::string>());
            return true;
        }
    } catch (const YAML::Exception& e) {
        LOG_DEBUG("ConfigParser", "Ignoring '" + key + "': " + e.what());
        return false;
    }

    LOG_DEBUG("ConfigParser", "Ignoring '" + key + "': expected a list");
    return false;
}

ChoiceSetOptions ProjectConfig::toChoiceSetOptions() const {
    ChoiceSetOptions options;
    options.use_defaults = use_defaults;
    options.custom_commit_types = custom_commit_types;
    options.scopes = scopes;
    return options;
}

static ProjectConfig configFromNode(const YAML::Node& root) {
    ProjectConfig config;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        LOG_DEBUG("ConfigParser", "Configuration is not a mapping, using defaults");
        return config;
    }

    if (root["use_defaults"]) {
        try {
            config.use_defaults = root["use_defaults"].as<bool>();
        } catch (const YAML::Exception& e) {
            LOG_DEBUG("ConfigParser", std::string("Ignoring 'use_defaults': ") + e.what());
        }
    }

    readStringList(root["custom_commit_types"], "custom_commit_types", config.custom_commit_types);
    readStringList(root["scopes"], "scopes", config.scopes);

    if (root["log_file"]) {
        try {
            config.log_file = trim(root["log_file"].as<std::string>());
        } catch (const YAML::Exception& e) {
            LOG_DEBUG("ConfigParser", std::string("Ignoring 'log_file': ") + e.what());
        }
    }

    return config;
}

ProjectConfig ConfigParser::parse(const std::string& yaml_text) {
    return configFromNode(YAML::Load(yaml_text));
}

ProjectConfig ConfigParser::loadFile(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        // It's okay if the file doesn't exist, the defaults apply.
        LOG_DEBUG("ConfigParser", "No configuration file at " + config_path);
        return ProjectConfig{};
    }

    try {
        ProjectConfig config = configFromNode(YAML::LoadFile(config_path));
        config.loaded_from_file = true;
        LOG_DEBUG("ConfigParser", "Loaded configuration from " + config_path);
        return config;
    } catch (const YAML::Exception& e) {
        Logger::getInstance().debug("ConfigParser", "Error reading config file, using defaults",
                                    config_path + ": " + e.what());
        return ProjectConfig{};
    }
}

bool ConfigParser::parseBool(const std::string& text, bool& value) {
    std::string lowered = trim(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        value = true;
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        value = false;
        return true;
    }
    return false;
}

std::vector<std::string> ConfigParser::splitList(const std::string& text) {
    std::vector<std::string> values;
    std::string current;

    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                values.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        values.push_back(current);
    }
    return values;
}

void ConfigParser::applyEnvironment(ProjectConfig& config) {
    if (const char* env = std::getenv("USE_DEFAULTS")) {
        bool value = config.use_defaults;
        if (parseBool(env, value)) {
            config.use_defaults = value;
        } else {
            LOG_DEBUG("ConfigParser", std::string("Ignoring USE_DEFAULTS=") + env);
        }
    }
    if (const char* env = std::getenv("CUSTOM_COMMIT_TYPES")) {
        config.custom_commit_types = splitList(env);
    }
    if (const char* env = std::getenv("SCOPES")) {
        config.scopes = splitList(env);
    }
}

} // namespace GitCC
