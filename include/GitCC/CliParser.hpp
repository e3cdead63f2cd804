// =================================================================
// include/GitCC/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace GitCC {

// Parsed command-line options.
struct Commands {
    bool show_version = false;
    bool debug = false;
};

/**
 * @brief Build information injected at compile time
 */
struct BuildInfo {
    static const char* version();
    static const char* commit();
    static const char* date();

    /**
     * @brief "version: <v>, commit: <c>, built at <d>"
     */
    static std::string describe();
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace GitCC
