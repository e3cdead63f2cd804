// =================================================================
// include/GitCC/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "GitCC/CliParser.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace GitCC {
    class SysInteraction;
    class PromptBackend;
}

namespace GitCC {

/**
 * @brief Process exit codes of git-cc
 */
enum class ExitCode : int {
    OK = 0,
    NOT_A_REPOSITORY = 1,
    NOTHING_STAGED = 2,
    COMMIT_FAILED = 3,
    CONFIG_ERROR = 4,
    ABORTED = 130
};

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Constructs the Core with explicit system and prompt access.
     */
    Core(const Commands& commands,
         std::unique_ptr<SysInteraction> sys,
         std::unique_ptr<PromptBackend> prompter);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the whole commit flow.
     * @return The process exit code.
     */
    int run();

private:
    int handleVersion();
    int handleCommit();
    void configureLogging();

    const Commands& m_commands;
    std::unique_ptr<SysInteraction> m_sys;
    std::unique_ptr<PromptBackend> m_prompter;
};

} // namespace GitCC
