// =================================================================
// include/GitCC/CommitRunner.hpp
// =================================================================
// Hands a finished message to `git commit`.

#pragma once

#include "GitCC/SysInteraction.hpp"
#include <string>

namespace GitCC {

/**
 * @brief Outcome of a commit attempt
 */
struct CommitResult {
    bool success = false;
    int exit_code = -1;         ///< Exit code of git, -1 if it did not run
    std::string error;          ///< Set when git could not be started
};

/**
 * @brief Commits the staged changes with a given message
 *
 * The message goes through a temporary file and `git commit -F`, so the
 * repository's commit hooks run as usual. git's own output is passed
 * straight to the terminal. The temporary file is removed afterwards.
 */
class CommitRunner {
public:
    static constexpr const char* kTempFilePrefix = "commitMessage";

    CommitRunner(SysInteraction& sys, const std::string& repo_root);

    CommitResult commit(const std::string& message);

private:
    SysInteraction& m_sys;
    std::string m_repo_root;
};

} // namespace GitCC
