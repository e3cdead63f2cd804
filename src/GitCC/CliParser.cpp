// =================================================================
// src/GitCC/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "GitCC/CliParser.hpp"

#ifndef GITCC_VERSION
#define GITCC_VERSION "dev"
#endif
#ifndef GITCC_COMMIT
#define GITCC_COMMIT "none"
#endif
#ifndef GITCC_BUILD_DATE
#define GITCC_BUILD_DATE "unknown"
#endif

namespace GitCC {

const char* BuildInfo::version() { return GITCC_VERSION; }
const char* BuildInfo::commit() { return GITCC_COMMIT; }
const char* BuildInfo::date() { return GITCC_BUILD_DATE; }

std::string BuildInfo::describe() {
    return std::string("version: ") + version() + ", commit: " + commit() + ", built at " + date();
}

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "git-cc: compose a Conventional Commits message interactively and commit the staged changes.",
        "git-cc");

    m_app->add_flag("-v,--version", m_commands.show_version, "Show version information");
    m_app->add_flag("-d,--debug", m_commands.debug,
                    "Print debug messages (also enabled by DEBUG=true)");

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

} // namespace GitCC
