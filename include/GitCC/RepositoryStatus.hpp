// =================================================================
// include/GitCC/RepositoryStatus.hpp
// =================================================================
// Decides whether the current directory is ready for a commit.

#pragma once

#include "GitCC/SysInteraction.hpp"
#include <string>

namespace GitCC {

/**
 * @brief Precondition for composing a commit
 */
enum class RepoState {
    READY,                      ///< Inside a work tree with staged changes
    NOT_A_REPOSITORY,
    NOTHING_STAGED,
    NOTHING_STAGED_UNTRACKED    ///< Nothing staged but untracked files exist
};

struct RepoStatusReport {
    RepoState state = RepoState::NOT_A_REPOSITORY;
    std::string root;           ///< Work tree root, set unless NOT_A_REPOSITORY
};

class RepositoryStatus {
public:
    /**
     * @param sys System access used to run git
     */
    explicit RepositoryStatus(SysInteraction& sys);

    /**
     * @brief Inspect the repository containing the current directory
     */
    RepoStatusReport check();

    /**
     * @brief Classify the output of `git status --porcelain`
     * @return READY, NOTHING_STAGED or NOTHING_STAGED_UNTRACKED
     */
    static RepoState classifyPorcelain(const std::string& porcelain);

    /**
     * @brief Message shown to the user for a failed precondition
     */
    static std::string describe(RepoState state);

private:
    SysInteraction& m_sys;
};

} // namespace GitCC
