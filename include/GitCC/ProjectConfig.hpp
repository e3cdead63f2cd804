// =================================================================
// include/GitCC/ProjectConfig.hpp
// =================================================================
// Loads the optional .git-cc.yaml file of a repository.

#pragma once

#include "GitCC/ChoiceSetResolver.hpp"
#include <string>
#include <vector>

namespace GitCC {

/**
 * @brief Settings read from .git-cc.yaml and the environment
 */
struct ProjectConfig {
    static constexpr const char* kFileName = ".git-cc.yaml";

    bool use_defaults = true;
    std::vector<std::string> custom_commit_types;
    std::vector<std::string> scopes;
    std::string log_file;       ///< Relative paths are taken from the repository root

    bool loaded_from_file = false;

    /**
     * @brief Inputs for the ChoiceSetResolver
     */
    ChoiceSetOptions toChoiceSetOptions() const;
};

class ConfigParser {
public:
    /**
     * @brief Read a configuration file
     *
     * A missing file, a YAML error or a value of the wrong type leaves the
     * affected settings at their defaults; problems are logged at debug
     * level.
     *
     * @param config_path The path to the .git-cc.yaml file.
     */
    static ProjectConfig loadFile(const std::string& config_path);

    /**
     * @brief Parse configuration text
     * @throws YAML::Exception on malformed input
     */
    static ProjectConfig parse(const std::string& yaml_text);

    /**
     * @brief Apply USE_DEFAULTS, CUSTOM_COMMIT_TYPES and SCOPES overrides
     */
    static void applyEnvironment(ProjectConfig& config);

    /**
     * @brief Interpret a boolean setting
     * @return True if the text was recognised, value set accordingly
     */
    static bool parseBool(const std::string& text, bool& value);

    /**
     * @brief Split a list given on one line by commas or whitespace
     */
    static std::vector<std::string> splitList(const std::string& text);
};

} // namespace GitCC
