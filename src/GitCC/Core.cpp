// =================================================================
// src/GitCC/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "GitCC/Core.hpp"
#include "GitCC/ChoiceSetResolver.hpp"
#include "GitCC/CommitRunner.hpp"
#include "GitCC/Logger.hpp"
#include "GitCC/MessageRenderer.hpp"
#include "GitCC/ProjectConfig.hpp"
#include "GitCC/PromptOrchestrator.hpp"
#include "GitCC/RepositoryStatus.hpp"
#include "GitCC/SessionStateStore.hpp"
#include "GitCC/SysInteraction.hpp"
#include "GitCC/TerminalPrompter.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace GitCC {

static int toInt(ExitCode code) {
    return static_cast<int>(code);
}

Core::Core(const Commands& commands)
    : Core(commands, std::make_unique<SysInteraction>(), std::make_unique<TerminalPrompter>()) {}

Core::Core(const Commands& commands,
           std::unique_ptr<SysInteraction> sys,
           std::unique_ptr<PromptBackend> prompter)
    : m_commands(commands),
      m_sys(std::move(sys)),
      m_prompter(std::move(prompter)) {}

Core::~Core() = default;

int Core::run() {
    if (m_commands.show_version) {
        return handleVersion();
    }

    configureLogging();
    return handleCommit();
}

int Core::handleVersion() {
    std::cout << BuildInfo::describe() << std::endl;
    return toInt(ExitCode::OK);
}

void Core::configureLogging() {
    bool debug = m_commands.debug;
    if (const char* env = std::getenv("DEBUG")) {
        std::string value(env);
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        debug = debug || value == "true";
    }
    if (debug) {
        Logger::getInstance().setConsoleLogLevel(LogLevel::DEBUG);
    }
}

int Core::handleCommit() {
    // Preconditions, nothing is asked before these pass
    RepositoryStatus status(*m_sys);
    RepoStatusReport report = status.check();
    switch (report.state) {
        case RepoState::READY:
            break;
        case RepoState::NOT_A_REPOSITORY:
            LOG_ERROR("Core", RepositoryStatus::describe(report.state));
            return toInt(ExitCode::NOT_A_REPOSITORY);
        case RepoState::NOTHING_STAGED:
        case RepoState::NOTHING_STAGED_UNTRACKED:
            LOG_ERROR("Core", RepositoryStatus::describe(report.state));
            return toInt(ExitCode::NOTHING_STAGED);
    }

    const std::filesystem::path root(report.root);

    ProjectConfig config = ConfigParser::loadFile((root / ProjectConfig::kFileName).string());
    ConfigParser::applyEnvironment(config);
    if (!config.log_file.empty()) {
        std::filesystem::path log_path(config.log_file);
        if (log_path.is_relative()) {
            log_path = root / log_path;
        }
        if (!Logger::getInstance().setLogFile(log_path.string())) {
            LOG_WARNING("Core", "Cannot write log file " + log_path.string());
        }
    }

    const ChoiceSet choices = ChoiceSetResolver::resolve(config.toChoiceSetOptions());
    if (choices.commit_types.empty()) {
        LOG_ERROR("Core", "No commit types available: use_defaults is off and custom_commit_types is empty");
        return toInt(ExitCode::CONFIG_ERROR);
    }

    SessionStateStore store((root / SessionStateStore::kFileName).string());
    LoadOutcome previous = store.tryLoad();
    AnswerSet restored;
    if (previous.status == LoadStatus::RESTORED) {
        restored = previous.answers;
        LOG_WARNING("Core", std::string("Restored previous session from ") + SessionStateStore::kFileName);
    } else if (previous.status == LoadStatus::CORRUPT) {
        Logger::getInstance().debug("Core", "Starting fresh, previous session is unreadable", previous.error);
    }

    PromptOrchestrator orchestrator(choices, *m_prompter, &store);
    AnswerSet answers;
    try {
        answers = orchestrator.run(restored);
    } catch (const PromptCancelled& e) {
        LOG_DEBUG("Core", e.what());
        if (orchestrator.getFailedSaves() == 0) {
            LOG_WARNING("Core", std::string("Aborted, answers so far are kept in ") + SessionStateStore::kFileName);
        } else {
            LOG_WARNING("Core", "Aborted");
        }
        return toInt(ExitCode::ABORTED);
    }

    std::string message = MessageRenderer::render(answers);
    LOG_DEBUG("Core", "Commit message:\n" + message);

    CommitRunner runner(*m_sys, report.root);
    CommitResult result = runner.commit(message);
    if (!result.success) {
        // git has already printed its own diagnostics
        if (!result.error.empty()) {
            LOG_ERROR("Core", "Commit failed: " + result.error);
        } else {
            LOG_ERROR("Core", "git commit exited with status " + std::to_string(result.exit_code));
        }
        return toInt(ExitCode::COMMIT_FAILED);
    }

    if (!store.clear()) {
        LOG_INFO("Core", "Remove " + store.path() + " before the next commit to start with empty answers");
    }
    return toInt(ExitCode::OK);
}

} // namespace GitCC
