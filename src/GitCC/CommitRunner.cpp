// =================================================================
// src/GitCC/CommitRunner.cpp
// =================================================================
// Implementation for the git commit handoff.

#include "GitCC/CommitRunner.hpp"
#include "GitCC/Logger.hpp"
#include <stdexcept>

namespace GitCC {

CommitRunner::CommitRunner(SysInteraction& sys, const std::string& repo_root)
    : m_sys(sys), m_repo_root(repo_root) {}

CommitResult CommitRunner::commit(const std::string& message) {
    CommitResult result;

    std::string message_file;
    try {
        message_file = m_sys.writeTempFile(kTempFilePrefix, message);
    } catch (const std::runtime_error& e) {
        result.error = e.what();
        return result;
    }
    LOG_DEBUG("CommitRunner", "temp file: " + message_file);

    std::vector<std::string> args;
    if (!m_repo_root.empty()) {
        args.push_back("-C");
        args.push_back(m_repo_root);
    }
    args.push_back("commit");
    args.push_back("-F");
    args.push_back(message_file);

    result.exit_code = m_sys.runCommand("git", args);
    result.success = result.exit_code == 0;
    if (result.exit_code < 0) {
        result.error = "git did not run to completion";
    }

    std::string cleanup_failure = m_sys.removeFile(message_file);
    if (!cleanup_failure.empty()) {
        LOG_DEBUG("CommitRunner", cleanup_failure);
    }

    return result;
}

} // namespace GitCC
